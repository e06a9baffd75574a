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

#include "HttpHeaderBlock.h"
#include <strings.h>


namespace Scanline
{

static inline bool hasName(const HttpHeader &header, std::string_view name)
{
    return header.name.size() == name.size()
           && 0 == strncasecmp(header.name.data(), name.data(), name.size());
}

bool HttpHeaderBlock::addHeader(std::string_view name, std::string_view value)
{
    if (isFull())
        return false;
    m_storage[m_headersCount++] = HttpHeader{.name = name, .value = value};
    return true;
}

bool HttpHeaderBlock::hasHeader(std::string_view name) const
{
    if (!name.empty())
    {
        for (const auto &header : headers())
        {
            if (hasName(header, name))
                return true;
        }
    }
    return false;
}

int HttpHeaderBlock::headerCount(std::string_view name) const
{
    int matchCount = 0;
    if (!name.empty())
    {
        for (const auto &header : headers())
        {
            if (hasName(header, name))
                ++matchCount;
        }
    }
    return matchCount;
}

std::string_view HttpHeaderBlock::header(std::string_view name, int pos) const
{
    int currentPos = 0;
    if (!name.empty() && pos > 0)
    {
        for (const auto &header : headers())
        {
            if (hasName(header, name) && ++currentPos == pos)
                return header.value;
        }
    }
    return {};
}

}
