#pragma once

#include <string>

// Random (version 4) UUID in lowercase canonical form, e.g.
// "3f2b8c1e-9d4a-4b7e-8f21-0c6d5e4a3b2f".
std::string generate_uuid_v4();

// True for a lowercase canonical UUID whose version nibble is 4 and whose
// variant is RFC 4122.
bool is_valid_uuid(const std::string& s);
