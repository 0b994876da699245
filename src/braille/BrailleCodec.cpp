#include "braille/BrailleCodec.hpp"

namespace braille {

void append(std::string& out, uint8_t pattern) {
    const Glyph g = encode(pattern);
    out.push_back(static_cast<char>(g[0]));
    out.push_back(static_cast<char>(g[1]));
    out.push_back(static_cast<char>(g[2]));
}

} // namespace braille
