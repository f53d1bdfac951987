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

#include <evmcore/rpc/call_error.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<evmcore::CallError>::mapping> const &
quick_status_code_from_enum<evmcore::CallError>::value_mappings()
{
    using evmcore::CallError;

    static std::initializer_list<mapping> const v = {
        {CallError::Success, "success", {errc::success}},
        {CallError::InvalidMessage, "invalid message", {}},
        {CallError::StateUnavailable, "state unavailable", {}},
        {CallError::Timeout, "execution aborted (timeout)", {errc::timed_out}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
