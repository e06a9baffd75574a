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

#include "ByteCursor.h"


namespace Scanline
{

size_t ByteCursor::advanceWhile(bool (*pPredicate)(uint8_t), size_t limit)
{
    // Stops one byte past the limit so callers can tell an exact fit from an overflow.
    assert(pPredicate);
    const char *pStop = (remaining() > limit) ? m_pCurrent + limit + 1 : m_pEnd;
    const char * const pStart = m_pCurrent;
    while (m_pCurrent < pStop && pPredicate(static_cast<uint8_t>(*m_pCurrent)))
        ++m_pCurrent;
    return m_pCurrent - pStart;
}

}
