#pragma once
#include "encoding/abi.hpp"

namespace ERC20 {
  // transfer(address,uint256)
  constexpr const char* kTransferSelector = "0xa9059cbb";
  // transferFrom(address,address,uint256)
  constexpr const char* kTransferFromSelector = "0x23b872dd";
  // approve(address,uint256)
  constexpr const char* kApproveSelector = "0x095ea7b3";
  // balanceOf(address)
  constexpr const char* kBalanceOfSelector = "0x70a08231";

  // Selector table used by the transaction data decoder
  const ABI::FunctionTable& KnownFunctions();
}
