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

#ifndef SCANLINE_HTTP_HEADER_H
#define SCANLINE_HTTP_HEADER_H

#include <string_view>


namespace Scanline
{

//
// A header field line as found in the parsed buffer. The name only holds token
// characters. The value holds raw bytes (it may contain obs-text) with surrounding
// whitespace excluded. Both refer to the caller's buffer, which must outlive the header.
//
struct HttpHeader
{
    std::string_view name;
    std::string_view value;
    bool operator==(const HttpHeader &other) const = default;
};

}

#endif // SCANLINE_HTTP_HEADER_H
