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

#ifndef SCANLINE_HTTP_REQUEST_PARSER_H
#define SCANLINE_HTTP_REQUEST_PARSER_H

#include "HttpHeader.h"
#include "HttpHeaderBlock.h"
#include "HttpParserOptions.h"
#include "HttpRequest.h"
#include "ParseStatus.h"
#include "../Core/ByteCursor.h"
#include "../Core/SDK.h"
#include <cstdint>
#include <limits>
#include <string_view>


namespace Scanline
{

//
// Parses the request line and the header block of HTTP/1.x requests directly from
// the caller's buffer, without copying or allocating. The parser keeps no state between
// calls: when parse returns Partial, the caller appends the bytes it receives next to the
// same buffer and calls parse again on the whole buffer. The same bytes always yield the
// same result, so a HttpRequestParser can be shared by any number of threads.
//
class SCANLINE_EXPORT HttpRequestParser
{
public:
    HttpRequestParser() = default;
    explicit HttpRequestParser(const HttpParserOptions &options);
    ~HttpRequestParser() = default;
    // On Complete, the value is the size of the request line plus the header block,
    // including the empty line that ends it. Body data, if any, starts right after it.
    ParseStatus<size_t> parse(std::string_view buffer, HttpRequest &request) const;
    // Parses a header block that starts at the beginning of the buffer.
    ParseStatus<size_t> parseHeaders(std::string_view buffer, HttpHeaderBlock &headers) const;

private:
    static ParseStep skipEmptyLines(ByteCursor &cursor);
    static ParseStep skipSpaces(ByteCursor &cursor);
    static ParseStep skipWhitespace(ByteCursor &cursor);
    static ParseStep skipLine(ByteCursor &cursor);
    static ParseStep parseNewLine(ByteCursor &cursor, HttpParseError unexpectedByteError);
    static ParseStatus<std::string_view> scanToken(ByteCursor &cursor,
                                                   bool (*pIsTokenByte)(uint8_t),
                                                   size_t maxSize,
                                                   HttpParseError tooLongError);
    static ParseStatus<std::string_view> parseMethod(ByteCursor &cursor);
    ParseStatus<std::string_view> parseUri(ByteCursor &cursor) const;
    static ParseStatus<uint8_t> parseVersion(ByteCursor &cursor);
    ParseStep parseHeaderLines(ByteCursor &cursor, HttpHeaderBlock &headers) const;
    ParseStatus<HttpHeader> parseHeaderLine(ByteCursor &cursor) const;

private:
    size_t m_maxUriSize = std::numeric_limits<size_t>::max();
    size_t m_maxHeaderNameSize = std::numeric_limits<size_t>::max();
    size_t m_maxHeaderValueSize = std::numeric_limits<size_t>::max();
    bool m_allowMultipleSpacesInRequestLineDelimiters = false;
    bool m_allowSpacesAfterHeaderName = false;
    bool m_ignoreInvalidHeaders = false;
};

}

#endif // SCANLINE_HTTP_REQUEST_PARSER_H
