#include "utf8.h"

using namespace std;

namespace aclock {

vector<uint32_t> decodeUtf8(const string& text) {
    vector<uint32_t> out;
    size_t i = 0;
    size_t n = text.size();

    while (i < n) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        int extra;
        uint32_t cp;
        uint32_t min;
        if (lead < 0x80) {
            out.push_back(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1; cp = lead & 0x1F; min = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2; cp = lead & 0x0F; min = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3; cp = lead & 0x07; min = 0x10000;
        } else {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        if (i + extra >= n) {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }
        bool valid = true;
        for (int k = 1; k <= extra; ++k) {
            unsigned char c = static_cast<unsigned char>(text[i + k]);
            if ((c & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (c & 0x3F);
        }
        if (!valid || cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

} // namespace aclock
