#ifndef ACLOCK_UTF8_H
#define ACLOCK_UTF8_H

#include <cstdint>
#include <string>
#include <vector>

namespace aclock {

const uint32_t REPLACEMENT_CHAR = '?';

// Decodes UTF-8 into code points. Malformed sequences become
// REPLACEMENT_CHAR, one per offending byte.
std::vector<uint32_t> decodeUtf8(const std::string& text);

} // namespace aclock

#endif
