#include "uuid.hpp"
#include <uuid/uuid.h>
#include <cctype>

std::string generate_uuid_v4() {
    uuid_t uuid;
    uuid_generate_random(uuid);

    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);
    return std::string(uuid_str);
}

bool is_valid_uuid(const std::string& s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(c)) ||
                   std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    if (s[14] != '4') return false;
    char variant = s[19];
    return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}
