// Helpers for EEG trigger portcodes.
// One byte goes on the wire per batch; each bit is one trigger line.
// Examples:
// 1   -> [  1/00000001]
// 4|8 -> [ 12/00001100]
// 0   -> flush marker, never written
#pragma once
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace portcode
{
const int kFlushCode = 0;
const int kMinCode = 0;
const int kMaxCode = 255;

inline bool isValidCode(int code)
{
    return code >= kMinCode && code <= kMaxCode;
}

inline bool isFlush(int code)
{
    return code == kFlushCode;
}

// Powers of two are the codes the recorder documents; others are still sent.
inline bool isSingleLine(int code)
{
    return code > 0 && code <= kMaxCode && (code & (code - 1)) == 0;
}

inline uint8_t combine(const std::vector<uint8_t> &codes)
{
    uint8_t out = 0;
    for (uint8_t c : codes)
        out |= c;
    return out;
}

inline std::string toBinary(uint8_t code)
{
    std::string bits(8, '0');
    for (int i = 0; i < 8; ++i)
    {
        if (code & (1u << (7 - i)))
            bits[i] = '1';
    }
    return bits;
}

// "[ 12/00001100]"
inline std::string formatCode(uint8_t code)
{
    std::ostringstream os;
    os << "[" << std::setw(3) << static_cast<int>(code) << "/" << toBinary(code) << "]";
    return os.str();
}
} // namespace portcode
