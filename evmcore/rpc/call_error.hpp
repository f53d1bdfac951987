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

#include <evmcore/core/config.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

EVMCORE_NAMESPACE_BEGIN

// Failures of the call executor itself, as opposed to a call that ran and
// reverted.
enum class CallError
{
    Success = 0,
    InvalidMessage,
    StateUnavailable,
    Timeout,
};

EVMCORE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<evmcore::CallError>
    : quick_status_code_from_enum_defaults<evmcore::CallError>
{
    static constexpr auto const domain_name = "Call Error";
    static constexpr auto const domain_uuid =
        "4f0c6e3a-9b2d-4c1e-8a57-2d61b9e3f0a4";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
