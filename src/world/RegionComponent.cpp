/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/RegionComponent.hpp"

namespace Strata {

std::string sanitizeComponentRecordName(const std::string& typeName)
{
    std::string sanitized = typeName;
    for (char& c : sanitized) {
        switch (c) {
            case ':':
            case '.':
            case '+':
            case '<':
            case '>':
            case ',':
            case ' ':
                c = '_';
                break;
            default:
                break;
        }
    }
    return sanitized;
}

} // namespace Strata
