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

#ifndef SCANLINE_HTTP_HEADER_BLOCK_H
#define SCANLINE_HTTP_HEADER_BLOCK_H

#include "HttpHeader.h"
#include "../Core/SDK.h"
#include <cassert>
#include <span>
#include <string_view>


namespace Scanline
{

class SCANLINE_EXPORT HttpHeaderBlock
{
public:
    explicit HttpHeaderBlock(std::span<HttpHeader> storage) : m_storage(storage) {}
    ~HttpHeaderBlock() = default;
    bool addHeader(std::string_view name, std::string_view value);
    inline void clear() {m_headersCount = 0;}
    inline size_t headersCount() const {return m_headersCount;}
    inline size_t capacity() const {return m_storage.size();}
    inline bool isFull() const {return m_headersCount == m_storage.size();}
    inline std::span<const HttpHeader> headers() const {return std::span<const HttpHeader>(m_storage.data(), m_headersCount);}
    inline const HttpHeader &operator[](size_t index) const
    {
        assert(index < m_headersCount);
        return m_storage[index];
    }
    bool hasHeader(std::string_view name) const;
    int headerCount(std::string_view name) const;
    std::string_view header(std::string_view name, int pos = 1) const;

private:
    std::span<HttpHeader> m_storage;
    size_t m_headersCount = 0;
};

}

#endif // SCANLINE_HTTP_HEADER_BLOCK_H
