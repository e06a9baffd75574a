//
// Copyright (C) 2024 Glauco Pacheco <glauco@kourier.io>
// SPDX-License-Identifier: AGPL-3.0-only
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Affero General Public License as
// published by the Free Software Foundation, version 3 of the License.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU Affero General Public License for more details.
//
// You should have received a copy of the GNU Affero General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.
//

#ifndef SCANLINE_PARSE_STATUS_H
#define SCANLINE_PARSE_STATUS_H

#include "HttpParseError.h"
#include <cassert>
#include <utility>
#include <variant>


namespace Scanline
{

//
// Outcome of a parsing step. Complete carries the parsed value and leaves the cursor
// right past it. Partial means the buffer ended while every byte seen so far was valid;
// the caller must append data and parse again from the start of the buffer. Failed means
// the input can never become valid, no matter how many bytes are appended.
//
template <class T>
class ParseStatus
{
public:
    enum class State {Complete, Partial, Failed};
    static ParseStatus complete(T value) {return ParseStatus(State::Complete, std::move(value), HttpParseError::NoError);}
    static ParseStatus partial() {return ParseStatus(State::Partial, T{}, HttpParseError::NoError);}
    static ParseStatus failed(HttpParseError error)
    {
        assert(error != HttpParseError::NoError);
        return ParseStatus(State::Failed, T{}, error);
    }
    inline State state() const {return m_state;}
    inline bool isComplete() const {return m_state == State::Complete;}
    inline bool isPartial() const {return m_state == State::Partial;}
    inline bool isFailed() const {return m_state == State::Failed;}
    inline const T &value() const
    {
        assert(isComplete());
        return m_value;
    }
    inline HttpParseError error() const {return m_error;}
    template <class U>
    ParseStatus<U> propagate() const
    {
        assert(!isComplete());
        return isPartial() ? ParseStatus<U>::partial() : ParseStatus<U>::failed(m_error);
    }
    bool operator==(const ParseStatus &other) const = default;

private:
    ParseStatus(State state, T value, HttpParseError error) :
        m_state(state),
        m_value(std::move(value)),
        m_error(error) {}

private:
    State m_state;
    T m_value;
    HttpParseError m_error;
};

using ParseStep = ParseStatus<std::monostate>;

}

#endif // SCANLINE_PARSE_STATUS_H
