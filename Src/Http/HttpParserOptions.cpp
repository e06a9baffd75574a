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

#include "HttpParserOptions.h"
#include <QtGlobal>
#include <limits>


namespace Scanline
{

bool HttpParserOptions::setOption(ParserOption option, int64_t value)
{
    if (value < 0)
    {
        m_errorMessage = "Failed to set option. Option values must be non-negative.";
        return false;
    }
    switch (option)
    {
        case ParserOption::AllowMultipleSpacesInRequestLineDelimiters:
        case ParserOption::AllowSpacesAfterHeaderName:
        case ParserOption::IgnoreInvalidHeaders:
            if (value > maxOptionValue(option))
            {
                m_errorMessage = "Failed to set option. Value must be either 0 (disabled) or 1 (enabled).";
                return false;
            }
            else
                break;
        case ParserOption::MaxUriSize:
        case ParserOption::MaxHeaderNameSize:
        case ParserOption::MaxHeaderValueSize:
            value = (value > 0) ? value : maxOptionValue(option);
            break;
    }
    m_options[option] = value;
    m_errorMessage.clear();
    return true;
}

int64_t HttpParserOptions::getOption(ParserOption option) const
{
    auto it = m_options.find(option);
    if (it != m_options.cend())
        return it->second;
    else
        return defaultOptionValue(option);
}

int64_t HttpParserOptions::defaultOptionValue(ParserOption option)
{
    switch (option)
    {
        case ParserOption::AllowMultipleSpacesInRequestLineDelimiters:
        case ParserOption::AllowSpacesAfterHeaderName:
        case ParserOption::IgnoreInvalidHeaders:
            return 0;
        case ParserOption::MaxUriSize:
        case ParserOption::MaxHeaderNameSize:
        case ParserOption::MaxHeaderValueSize:
            return maxOptionValue(option);
        default:
            Q_UNREACHABLE();
    }
}

int64_t HttpParserOptions::maxOptionValue(ParserOption option)
{
    switch (option)
    {
        case ParserOption::AllowMultipleSpacesInRequestLineDelimiters:
        case ParserOption::AllowSpacesAfterHeaderName:
        case ParserOption::IgnoreInvalidHeaders:
            return 1;
        case ParserOption::MaxUriSize:
        case ParserOption::MaxHeaderNameSize:
        case ParserOption::MaxHeaderValueSize:
            return std::numeric_limits<int64_t>::max();
        default:
            Q_UNREACHABLE();
    }
}

}
