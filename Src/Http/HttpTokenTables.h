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

#ifndef SCANLINE_HTTP_TOKEN_TABLES_H
#define SCANLINE_HTTP_TOKEN_TABLES_H

#include <QtCompilerDetection>
#include <array>
#include <cstdint>


namespace Scanline
{

namespace HttpTokenTables
{

using ByteTable = std::array<bool, 256>;

template <class Predicate>
constexpr ByteTable makeByteTable(Predicate isMember)
{
    ByteTable table{};
    for (auto i = 0; i < 256; ++i)
        table[i] = isMember(static_cast<uint8_t>(i));
    return table;
}

//
// Per section 5.6.2 of RFC9110:
//
// token          = 1*tchar
// tchar          = "!" / "#" / "$" / "%" / "&" / "'" / "*"
//                / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
//                / DIGIT / ALPHA
//
inline constexpr ByteTable tokenTable = makeByteTable([](uint8_t ch)
{
    switch (ch)
    {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return ('0' <= ch && ch <= '9') || ('A' <= ch && ch <= 'Z') || ('a' <= ch && ch <= 'z');
    }
});

// HTAB / SP / VCHAR / obs-text
inline constexpr ByteTable headerValueTable = makeByteTable([](uint8_t ch)
{
    return ch == '\t' || (0x20 <= ch && ch <= 0x7E) || ch >= 0x80;
});

// Accepts any visible byte. Percent-encoding and component syntax are left to the application.
inline constexpr ByteTable uriTable = makeByteTable([](uint8_t ch)
{
    return (0x21 <= ch && ch <= 0x7E) || ch >= 0x80;
});

inline bool isMethodToken(uint8_t ch)
{
    if (Q_LIKELY('A' <= ch && ch <= 'Z'))
        return true;
    else
        return tokenTable[ch];
}

inline bool isHeaderNameToken(uint8_t ch) {return tokenTable[ch];}
inline bool isHeaderValueByte(uint8_t ch) {return headerValueTable[ch];}
inline bool isUriByte(uint8_t ch) {return uriTable[ch];}
inline bool isWhitespace(uint8_t ch) {return ch == ' ' || ch == '\t';}

}

}

#endif // SCANLINE_HTTP_TOKEN_TABLES_H
