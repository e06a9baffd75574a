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

#ifndef SCANLINE_BYTE_CURSOR_H
#define SCANLINE_BYTE_CURSOR_H

#include "SDK.h"
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>


namespace Scanline
{

class SCANLINE_EXPORT ByteCursor
{
public:
    explicit ByteCursor(std::string_view buffer) :
        m_pBegin(buffer.data()),
        m_pEnd(buffer.data() + buffer.size()),
        m_pCurrent(m_pBegin),
        m_pSliceStart(m_pBegin) {}
    ByteCursor(const ByteCursor &) = delete;
    ~ByteCursor() = default;
    ByteCursor &operator=(const ByteCursor &) = delete;
    inline std::optional<uint8_t> peek() const
    {
        if (m_pCurrent < m_pEnd)
            return static_cast<uint8_t>(*m_pCurrent);
        else
            return std::nullopt;
    }
    // Callers must have peeked a byte at the current position.
    inline void advance()
    {
        assert(m_pCurrent < m_pEnd);
        ++m_pCurrent;
    }
    inline std::optional<uint8_t> next()
    {
        if (m_pCurrent < m_pEnd)
            return static_cast<uint8_t>(*m_pCurrent++);
        else
            return std::nullopt;
    }
    inline void mark() {m_pSliceStart = m_pCurrent;}
    inline std::string_view takeSlice()
    {
        const std::string_view slice(m_pSliceStart, m_pCurrent - m_pSliceStart);
        m_pSliceStart = m_pCurrent;
        return slice;
    }
    inline size_t position() const {return m_pCurrent - m_pBegin;}
    inline size_t remaining() const {return m_pEnd - m_pCurrent;}
    inline bool atEnd() const {return m_pCurrent == m_pEnd;}
    size_t advanceWhile(bool (*pPredicate)(uint8_t), size_t limit);

private:
    const char *m_pBegin;
    const char *m_pEnd;
    const char *m_pCurrent;
    const char *m_pSliceStart;
};

}

#endif // SCANLINE_BYTE_CURSOR_H
