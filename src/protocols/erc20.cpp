#include "protocols/erc20.hpp"

namespace ERC20 {
  const ABI::FunctionTable& KnownFunctions() {
    using ABI::ParamType;
    static const ABI::FunctionTable table{
      {kTransferSelector, {"transfer", {ParamType::ADDRESS, ParamType::UINT256}}},
      {kTransferFromSelector, {"transferFrom", {ParamType::ADDRESS, ParamType::ADDRESS, ParamType::UINT256}}},
      {kApproveSelector, {"approve", {ParamType::ADDRESS, ParamType::UINT256}}},
      {kBalanceOfSelector, {"balanceOf", {ParamType::ADDRESS}}},
    };
    return table;
  }
}
