// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <stakepool/core/byte_string.hpp>
#include <stakepool/core/bytes.hpp>
#include <stakepool/ledger/config.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

// First byte of every instruction.
enum class Opcode : uint8_t
{
    Initialize = 0,
    Deposit = 1,
    Withdraw = 2,
    StartEpoch = 3,
    Claim = 4,
};

std::string_view opcode_name(Opcode);

std::optional<Opcode> opcode_from_name(std::string_view);

////////////////////////////
// Instruction Encoding  //
////////////////////////////

byte_string encode_initialize();

byte_string encode_initialize(
    bytes32_t const &stake_asset, bytes32_t const &reward_asset);

byte_string encode_deposit(uint64_t amount);

byte_string encode_withdraw(uint64_t amount);

byte_string
encode_start_epoch(uint64_t start_time, uint64_t end_time, uint64_t reward);

byte_string encode_claim();

STAKEPOOL_LEDGER_NAMESPACE_END
