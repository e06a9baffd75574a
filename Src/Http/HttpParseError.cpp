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

#include "HttpParseError.h"
#include <QtGlobal>


namespace Scanline
{

std::string_view errorMessage(HttpParseError error)
{
    switch (error)
    {
        case HttpParseError::NoError: return "No error.";
        case HttpParseError::InvalidMethod: return "Invalid method token.";
        case HttpParseError::InvalidUri: return "Invalid byte in request target.";
        case HttpParseError::InvalidVersion: return "Invalid or unsupported HTTP version.";
        case HttpParseError::InvalidHeaderName: return "Invalid header name token.";
        case HttpParseError::InvalidHeaderValue: return "Invalid byte in header value.";
        case HttpParseError::MissingColon: return "Missing colon after header name.";
        case HttpParseError::InvalidNewLine: return "Invalid line ending. CR must be followed by LF.";
        case HttpParseError::TooManyHeaders: return "Too many headers for the given header storage.";
        case HttpParseError::UriTooLong: return "Request target exceeds the configured size limit.";
        case HttpParseError::HeaderNameTooLong: return "Header name exceeds the configured size limit.";
        case HttpParseError::HeaderValueTooLong: return "Header value exceeds the configured size limit.";
    }
    Q_UNREACHABLE();
}

}
