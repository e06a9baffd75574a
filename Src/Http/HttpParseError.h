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

#ifndef SCANLINE_HTTP_PARSE_ERROR_H
#define SCANLINE_HTTP_PARSE_ERROR_H

#include "../Core/SDK.h"
#include <string_view>


namespace Scanline
{

enum class HttpParseError
{
    NoError,
    InvalidMethod,
    InvalidUri,
    InvalidVersion,
    InvalidHeaderName,
    InvalidHeaderValue,
    MissingColon,
    InvalidNewLine,
    TooManyHeaders,
    UriTooLong,
    HeaderNameTooLong,
    HeaderValueTooLong
};

SCANLINE_EXPORT std::string_view errorMessage(HttpParseError error);

}

#endif // SCANLINE_HTTP_PARSE_ERROR_H
