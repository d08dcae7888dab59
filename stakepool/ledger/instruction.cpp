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

#include <stakepool/core/little_endian.hpp>
#include <stakepool/ledger/instruction.hpp>

#include <array>
#include <utility>

STAKEPOOL_LEDGER_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::array<std::pair<Opcode, std::string_view>, 5> OPCODE_NAMES{{
    {Opcode::Initialize, "initialize"},
    {Opcode::Deposit, "deposit"},
    {Opcode::Withdraw, "withdraw"},
    {Opcode::StartEpoch, "start_epoch"},
    {Opcode::Claim, "claim"},
}};

byte_string encode_opcode(Opcode const op)
{
    byte_string out;
    out += static_cast<uint8_t>(op);
    return out;
}

void append(byte_string &out, u64_le const value)
{
    out += to_byte_string_view(value.bytes);
}

STAKEPOOL_LEDGER_ANONYMOUS_NAMESPACE_END

STAKEPOOL_LEDGER_NAMESPACE_BEGIN

std::string_view opcode_name(Opcode const op)
{
    for (auto const &[code, name] : OPCODE_NAMES) {
        if (code == op) {
            return name;
        }
    }
    return "unknown";
}

std::optional<Opcode> opcode_from_name(std::string_view const name)
{
    for (auto const &[code, n] : OPCODE_NAMES) {
        if (n == name) {
            return code;
        }
    }
    return std::nullopt;
}

byte_string encode_initialize()
{
    return encode_opcode(Opcode::Initialize);
}

byte_string encode_initialize(
    bytes32_t const &stake_asset, bytes32_t const &reward_asset)
{
    auto out = encode_opcode(Opcode::Initialize);
    out += to_byte_string_view(stake_asset.bytes);
    out += to_byte_string_view(reward_asset.bytes);
    return out;
}

byte_string encode_deposit(uint64_t const amount)
{
    auto out = encode_opcode(Opcode::Deposit);
    append(out, amount);
    return out;
}

byte_string encode_withdraw(uint64_t const amount)
{
    auto out = encode_opcode(Opcode::Withdraw);
    append(out, amount);
    return out;
}

byte_string encode_start_epoch(
    uint64_t const start_time, uint64_t const end_time, uint64_t const reward)
{
    auto out = encode_opcode(Opcode::StartEpoch);
    append(out, start_time);
    append(out, end_time);
    append(out, reward);
    return out;
}

byte_string encode_claim()
{
    return encode_opcode(Opcode::Claim);
}

STAKEPOOL_LEDGER_NAMESPACE_END
