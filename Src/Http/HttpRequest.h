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

#ifndef SCANLINE_HTTP_REQUEST_H
#define SCANLINE_HTTP_REQUEST_H

#include "HttpHeaderBlock.h"
#include "../Core/SDK.h"
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>


namespace Scanline
{

//
// Request line and header block of an HTTP/1.x request. All views point into the
// buffer given to HttpRequestParser::parse. Fields are filled from left to right as
// parsing progresses, so after a Partial or Failed parse the leading fields (such as
// method and path) may be set while later ones are not.
//
class SCANLINE_EXPORT HttpRequest
{
public:
    explicit HttpRequest(std::span<HttpHeader> headerStorage) : m_headers(headerStorage) {}
    ~HttpRequest() = default;
    inline std::optional<std::string_view> method() const {return m_method;}
    inline std::optional<std::string_view> path() const {return m_path;}
    inline std::optional<uint8_t> version() const {return m_version;}
    inline HttpHeaderBlock &headers() {return m_headers;}
    inline const HttpHeaderBlock &headers() const {return m_headers;}
    void clear();

private:
    std::optional<std::string_view> m_method;
    std::optional<std::string_view> m_path;
    std::optional<uint8_t> m_version;
    HttpHeaderBlock m_headers;
    friend class HttpRequestParser;
};

}

#endif // SCANLINE_HTTP_REQUEST_H
