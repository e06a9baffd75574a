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

#include "HttpRequestParser.h"
#include "HttpTokenTables.h"
#include <QtGlobal>
#include <variant>


namespace Scanline
{

using ParserOption = HttpParserOptions::ParserOption;

HttpRequestParser::HttpRequestParser(const HttpParserOptions &options) :
    m_maxUriSize(static_cast<size_t>(options.getOption(ParserOption::MaxUriSize))),
    m_maxHeaderNameSize(static_cast<size_t>(options.getOption(ParserOption::MaxHeaderNameSize))),
    m_maxHeaderValueSize(static_cast<size_t>(options.getOption(ParserOption::MaxHeaderValueSize))),
    m_allowMultipleSpacesInRequestLineDelimiters(options.isEnabled(ParserOption::AllowMultipleSpacesInRequestLineDelimiters)),
    m_allowSpacesAfterHeaderName(options.isEnabled(ParserOption::AllowSpacesAfterHeaderName)),
    m_ignoreInvalidHeaders(options.isEnabled(ParserOption::IgnoreInvalidHeaders))
{
}

ParseStatus<size_t> HttpRequestParser::parse(std::string_view buffer, HttpRequest &request) const
{
    //
    // Per section 3 of RFC9112:
    //
    // request-line   = method SP request-target SP HTTP-version
    // HTTP-message   = start-line CRLF *( field-line CRLF ) CRLF [ message-body ]
    //
    // Bare LFs are accepted as line terminators and, per section 2.2 of RFC9112,
    // empty lines received before the request line are ignored.
    //
    request.clear();
    ByteCursor cursor(buffer);
    if (const auto status = skipEmptyLines(cursor); !status.isComplete())
        return status.propagate<size_t>();
    const auto method = parseMethod(cursor);
    if (!method.isComplete())
        return method.propagate<size_t>();
    request.m_method = method.value();
    if (m_allowMultipleSpacesInRequestLineDelimiters)
    {
        if (const auto status = skipSpaces(cursor); !status.isComplete())
            return status.propagate<size_t>();
    }
    const auto path = parseUri(cursor);
    if (!path.isComplete())
        return path.propagate<size_t>();
    request.m_path = path.value();
    if (m_allowMultipleSpacesInRequestLineDelimiters)
    {
        if (const auto status = skipSpaces(cursor); !status.isComplete())
            return status.propagate<size_t>();
    }
    const auto version = parseVersion(cursor);
    if (!version.isComplete())
        return version.propagate<size_t>();
    request.m_version = version.value();
    if (const auto status = parseNewLine(cursor, HttpParseError::InvalidVersion); !status.isComplete())
        return status.propagate<size_t>();
    if (const auto status = parseHeaderLines(cursor, request.m_headers); !status.isComplete())
        return status.propagate<size_t>();
    return ParseStatus<size_t>::complete(cursor.position());
}

ParseStatus<size_t> HttpRequestParser::parseHeaders(std::string_view buffer, HttpHeaderBlock &headers) const
{
    headers.clear();
    ByteCursor cursor(buffer);
    if (const auto status = parseHeaderLines(cursor, headers); !status.isComplete())
        return status.propagate<size_t>();
    return ParseStatus<size_t>::complete(cursor.position());
}

ParseStep HttpRequestParser::skipEmptyLines(ByteCursor &cursor)
{
    while (true)
    {
        const auto ch = cursor.peek();
        if (!ch)
            return ParseStep::partial();
        switch (*ch)
        {
            case '\r':
            {
                cursor.advance();
                const auto lf = cursor.next();
                if (!lf)
                    return ParseStep::partial();
                else if (*lf != '\n')
                    return ParseStep::failed(HttpParseError::InvalidNewLine);
                else
                    continue;
            }
            case '\n':
                cursor.advance();
                continue;
            default:
                cursor.mark();
                return ParseStep::complete({});
        }
    }
}

ParseStep HttpRequestParser::skipSpaces(ByteCursor &cursor)
{
    while (true)
    {
        const auto ch = cursor.peek();
        if (!ch)
            return ParseStep::partial();
        else if (*ch == ' ')
            cursor.advance();
        else
            return ParseStep::complete({});
    }
}

ParseStep HttpRequestParser::skipWhitespace(ByteCursor &cursor)
{
    while (true)
    {
        const auto ch = cursor.peek();
        if (!ch)
            return ParseStep::partial();
        else if (HttpTokenTables::isWhitespace(*ch))
            cursor.advance();
        else
            return ParseStep::complete({});
    }
}

ParseStep HttpRequestParser::skipLine(ByteCursor &cursor)
{
    while (const auto ch = cursor.next())
    {
        if (*ch == '\n')
        {
            cursor.mark();
            return ParseStep::complete({});
        }
    }
    return ParseStep::partial();
}

ParseStep HttpRequestParser::parseNewLine(ByteCursor &cursor, HttpParseError unexpectedByteError)
{
    const auto ch = cursor.peek();
    if (!ch)
        return ParseStep::partial();
    switch (*ch)
    {
        case '\r':
        {
            cursor.advance();
            const auto lf = cursor.next();
            if (!lf)
                return ParseStep::partial();
            else if (*lf == '\n')
                return ParseStep::complete({});
            else
                return ParseStep::failed(HttpParseError::InvalidNewLine);
        }
        case '\n':
            cursor.advance();
            return ParseStep::complete({});
        default:
            return ParseStep::failed(unexpectedByteError);
    }
}

ParseStatus<std::string_view> HttpRequestParser::scanToken(ByteCursor &cursor,
                                                          bool (*pIsTokenByte)(uint8_t),
                                                          size_t maxSize,
                                                          HttpParseError tooLongError)
{
    // Consumes token bytes up to, but not including, the first byte that does not belong
    // to the token. Completes only when that byte is available.
    cursor.mark();
    const auto tokenSize = cursor.advanceWhile(pIsTokenByte, maxSize);
    if (tokenSize > maxSize)
        return ParseStatus<std::string_view>::failed(tooLongError);
    else if (cursor.atEnd())
        return ParseStatus<std::string_view>::partial();
    else
        return ParseStatus<std::string_view>::complete(cursor.takeSlice());
}

ParseStatus<std::string_view> HttpRequestParser::parseMethod(ByteCursor &cursor)
{
    const auto method = scanToken(cursor, HttpTokenTables::isMethodToken, std::numeric_limits<size_t>::max(), HttpParseError::InvalidMethod);
    if (!method.isComplete())
        return method;
    else if (method.value().empty() || *cursor.peek() != ' ')
        return ParseStatus<std::string_view>::failed(HttpParseError::InvalidMethod);
    cursor.advance();
    cursor.mark();
    return method;
}

ParseStatus<std::string_view> HttpRequestParser::parseUri(ByteCursor &cursor) const
{
    const auto uri = scanToken(cursor, HttpTokenTables::isUriByte, m_maxUriSize, HttpParseError::UriTooLong);
    if (!uri.isComplete())
        return uri;
    else if (uri.value().empty() || *cursor.peek() != ' ')
        return ParseStatus<std::string_view>::failed(HttpParseError::InvalidUri);
    cursor.advance();
    cursor.mark();
    return uri;
}

ParseStatus<uint8_t> HttpRequestParser::parseVersion(ByteCursor &cursor)
{
    // HTTP-version = "HTTP/1." ( "0" / "1" )
    static constexpr std::string_view versionPrefix = "HTTP/1.";
    for (const char expected : versionPrefix)
    {
        const auto ch = cursor.next();
        if (!ch)
            return ParseStatus<uint8_t>::partial();
        else if (*ch != static_cast<uint8_t>(expected))
            return ParseStatus<uint8_t>::failed(HttpParseError::InvalidVersion);
    }
    const auto minorVersion = cursor.next();
    if (!minorVersion)
        return ParseStatus<uint8_t>::partial();
    switch (*minorVersion)
    {
        case '0':
            return ParseStatus<uint8_t>::complete(0);
        case '1':
            return ParseStatus<uint8_t>::complete(1);
        default:
            return ParseStatus<uint8_t>::failed(HttpParseError::InvalidVersion);
    }
}

ParseStep HttpRequestParser::parseHeaderLines(ByteCursor &cursor, HttpHeaderBlock &headers) const
{
    while (true)
    {
        const auto ch = cursor.peek();
        if (!ch)
            return ParseStep::partial();
        else if (*ch == '\r' || *ch == '\n')
            return parseNewLine(cursor, HttpParseError::InvalidNewLine);
        else if (headers.isFull())
            return ParseStep::failed(HttpParseError::TooManyHeaders);
        const auto header = parseHeaderLine(cursor);
        switch (header.state())
        {
            case ParseStatus<HttpHeader>::State::Complete:
                if (!headers.addHeader(header.value().name, header.value().value))
                    return ParseStep::failed(HttpParseError::TooManyHeaders);
                continue;
            case ParseStatus<HttpHeader>::State::Partial:
                return ParseStep::partial();
            case ParseStatus<HttpHeader>::State::Failed:
                switch (header.error())
                {
                    case HttpParseError::InvalidHeaderName:
                    case HttpParseError::InvalidHeaderValue:
                    case HttpParseError::MissingColon:
                        if (m_ignoreInvalidHeaders)
                        {
                            if (const auto status = skipLine(cursor); !status.isComplete())
                                return status;
                            continue;
                        }
                        [[fallthrough]];
                    default:
                        return header.propagate<std::monostate>();
                }
        }
        Q_UNREACHABLE();
    }
}

ParseStatus<HttpHeader> HttpRequestParser::parseHeaderLine(ByteCursor &cursor) const
{
    //
    // Per section 5 of RFC9112 and section 5.5 of RFC9110:
    //
    // field-line     = field-name ":" OWS field-value OWS
    // field-name     = token
    // field-value    = *field-content
    // field-content  = field-vchar [ 1*( SP / HTAB / field-vchar ) field-vchar ]
    // field-vchar    = VCHAR / obs-text
    //
    const auto name = scanToken(cursor, HttpTokenTables::isHeaderNameToken, m_maxHeaderNameSize, HttpParseError::HeaderNameTooLong);
    if (!name.isComplete())
        return name.propagate<HttpHeader>();
    else if (name.value().empty())
        return ParseStatus<HttpHeader>::failed(HttpParseError::InvalidHeaderName);
    if (m_allowSpacesAfterHeaderName)
    {
        if (const auto status = skipWhitespace(cursor); !status.isComplete())
            return status.propagate<HttpHeader>();
    }
    switch (*cursor.peek())
    {
        case ':':
            cursor.advance();
            break;
        case ' ':
        case '\t':
        case '\r':
        case '\n':
            return ParseStatus<HttpHeader>::failed(HttpParseError::MissingColon);
        default:
            return ParseStatus<HttpHeader>::failed(HttpParseError::InvalidHeaderName);
    }
    if (const auto status = skipWhitespace(cursor); !status.isComplete())
        return status.propagate<HttpHeader>();
    cursor.mark();
    cursor.advanceWhile(HttpTokenTables::isHeaderValueByte, std::numeric_limits<size_t>::max());
    auto fieldValue = cursor.takeSlice();
    while (!fieldValue.empty() && HttpTokenTables::isWhitespace(static_cast<uint8_t>(fieldValue.back())))
        fieldValue.remove_suffix(1);
    // The limit applies to the trimmed value, which can only grow as more bytes arrive.
    if (fieldValue.size() > m_maxHeaderValueSize)
        return ParseStatus<HttpHeader>::failed(HttpParseError::HeaderValueTooLong);
    else if (cursor.atEnd())
        return ParseStatus<HttpHeader>::partial();
    // A CR that is not followed by a LF is never part of a field value.
    if (const auto status = parseNewLine(cursor, HttpParseError::InvalidHeaderValue); !status.isComplete())
        return status.propagate<HttpHeader>();
    return ParseStatus<HttpHeader>::complete(HttpHeader{.name = name.value(), .value = fieldValue});
}

}
