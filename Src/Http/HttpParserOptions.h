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

#ifndef SCANLINE_HTTP_PARSER_OPTIONS_H
#define SCANLINE_HTTP_PARSER_OPTIONS_H

#include "../Core/SDK.h"
#include <cstdint>
#include <map>
#include <string>
#include <string_view>


namespace Scanline
{

class SCANLINE_EXPORT HttpParserOptions
{
public:
    enum class ParserOption
    {
        AllowMultipleSpacesInRequestLineDelimiters,
        AllowSpacesAfterHeaderName,
        IgnoreInvalidHeaders,
        MaxUriSize,
        MaxHeaderNameSize,
        MaxHeaderValueSize
    };
    bool setOption(ParserOption option, int64_t value);
    int64_t getOption(ParserOption option) const;
    inline bool isEnabled(ParserOption option) const {return getOption(option) != 0;}
    inline std::string_view errorMessage() const {return m_errorMessage;}
    static int64_t defaultOptionValue(ParserOption option);
    static int64_t maxOptionValue(ParserOption option);

private:
    std::map<ParserOption, int64_t> m_options;
    std::string m_errorMessage;
};

}

#endif // SCANLINE_HTTP_PARSER_OPTIONS_H
