#include "juicebox/window/KeysymTable.hpp"

#include <X11/keysym.h>

namespace juicebox {

namespace {

// Latin Extended-B, U+0180..U+01CC
constexpr std::uint16_t kLatinExtBUpper[] = {
    0x0180, 0x0181, 0x0182, 0x0182, 0x0184, 0x0184, 0x0186, 0x0187,
    0x0187, 0x0189, 0x018a, 0x018b, 0x018b, 0x018d, 0x018e, 0x018f,
    0x0190, 0x0191, 0x0191, 0x0193, 0x0194, 0x01f6, 0x0196, 0x0197,
    0x0198, 0x0198, 0x019a, 0x019b, 0x019c, 0x019d, 0x0220, 0x019f,
    0x01a0, 0x01a0, 0x01a2, 0x01a2, 0x01a4, 0x01a4, 0x01a6, 0x01a7,
    0x01a7, 0x01a9, 0x01aa, 0x01ab, 0x01ac, 0x01ac, 0x01ae, 0x01af,
    0x01af, 0x01b1, 0x01b2, 0x01b3, 0x01b3, 0x01b5, 0x01b5, 0x01b7,
    0x01b8, 0x01b8, 0x01ba, 0x01bb, 0x01bc, 0x01bc, 0x01be, 0x01f7,
    0x01c0, 0x01c1, 0x01c2, 0x01c3, 0x01c4, 0x01c4, 0x01c4, 0x01c7,
    0x01c7, 0x01c7, 0x01ca, 0x01ca, 0x01ca,
};

constexpr std::uint16_t kLatinExtBLower[] = {
    0x0180, 0x0253, 0x0183, 0x0183, 0x0185, 0x0185, 0x0254, 0x0188,
    0x0188, 0x0256, 0x0257, 0x018c, 0x018c, 0x018d, 0x01dd, 0x0259,
    0x025b, 0x0192, 0x0192, 0x0260, 0x0263, 0x0195, 0x0269, 0x0268,
    0x0199, 0x0199, 0x019a, 0x019b, 0x026f, 0x0272, 0x019e, 0x0275,
    0x01a1, 0x01a1, 0x01a3, 0x01a3, 0x01a5, 0x01a5, 0x0280, 0x01a8,
    0x01a8, 0x0283, 0x01aa, 0x01ab, 0x01ad, 0x01ad, 0x0288, 0x01b0,
    0x01b0, 0x028a, 0x028b, 0x01b4, 0x01b4, 0x01b6, 0x01b6, 0x0292,
    0x01b9, 0x01b9, 0x01ba, 0x01bb, 0x01bd, 0x01bd, 0x01be, 0x01bf,
    0x01c0, 0x01c1, 0x01c2, 0x01c3, 0x01c6, 0x01c6, 0x01c6, 0x01c9,
    0x01c9, 0x01c9, 0x01cc, 0x01cc, 0x01cc,
};

// IPA Extensions, U+0253..U+0292 (uppercase only)
constexpr std::uint16_t kIpaUpper[] = {
    0x0181, 0x0186, 0x0255, 0x0189, 0x018a, 0x0258, 0x018f, 0x025a,
    0x0190, 0x025c, 0x025d, 0x025e, 0x025f, 0x0193, 0x0261, 0x0262,
    0x0194, 0x0264, 0x0265, 0x0266, 0x0267, 0x0197, 0x0196, 0x026a,
    0x026b, 0x026c, 0x026d, 0x026e, 0x019c, 0x0270, 0x0271, 0x019d,
    0x0273, 0x0274, 0x019f, 0x0276, 0x0277, 0x0278, 0x0279, 0x027a,
    0x027b, 0x027c, 0x027d, 0x027e, 0x027f, 0x01a6, 0x0281, 0x0282,
    0x01a9, 0x0284, 0x0285, 0x0286, 0x0287, 0x01ae, 0x0289, 0x01b1,
    0x01b2, 0x028c, 0x028d, 0x028e, 0x028f, 0x0290, 0x0291, 0x01b7,
};

// Greek and Coptic, U+0370..U+03FF
constexpr std::uint16_t kGreekUpper[] = {
    0x0370, 0x0371, 0x0372, 0x0373, 0x0374, 0x0375, 0x0376, 0x0377,
    0x0378, 0x0379, 0x037a, 0x037b, 0x037c, 0x037d, 0x037e, 0x037f,
    0x0380, 0x0381, 0x0382, 0x0383, 0x0384, 0x0385, 0x0386, 0x0387,
    0x0388, 0x0389, 0x038a, 0x038b, 0x038c, 0x038d, 0x038e, 0x038f,
    0x0390, 0x0391, 0x0392, 0x0393, 0x0394, 0x0395, 0x0396, 0x0397,
    0x0398, 0x0399, 0x039a, 0x039b, 0x039c, 0x039d, 0x039e, 0x039f,
    0x03a0, 0x03a1, 0x03a2, 0x03a3, 0x03a4, 0x03a5, 0x03a6, 0x03a7,
    0x03a8, 0x03a9, 0x03aa, 0x03ab, 0x0386, 0x0388, 0x0389, 0x038a,
    0x03b0, 0x0391, 0x0392, 0x0393, 0x0394, 0x0395, 0x0396, 0x0397,
    0x0398, 0x0399, 0x039a, 0x039b, 0x039c, 0x039d, 0x039e, 0x039f,
    0x03a0, 0x03a1, 0x03a3, 0x03a3, 0x03a4, 0x03a5, 0x03a6, 0x03a7,
    0x03a8, 0x03a9, 0x03aa, 0x03ab, 0x038c, 0x038e, 0x038f, 0x03cf,
    0x0392, 0x0398, 0x03d2, 0x03d3, 0x03d4, 0x03a6, 0x03a0, 0x03d7,
    0x03d8, 0x03d8, 0x03da, 0x03da, 0x03dc, 0x03dc, 0x03de, 0x03de,
    0x03e0, 0x03e0, 0x03e2, 0x03e2, 0x03e4, 0x03e4, 0x03e6, 0x03e6,
    0x03e8, 0x03e8, 0x03ea, 0x03ea, 0x03ec, 0x03ec, 0x03ee, 0x03ee,
    0x039a, 0x03a1, 0x03f2, 0x03f3, 0x03f4, 0x0395, 0x03f6, 0x03f7,
    0x03f8, 0x03f9, 0x03fa, 0x03fb, 0x03fc, 0x03fd, 0x03fe, 0x03ff,
};

constexpr std::uint16_t kGreekLower[] = {
    0x0370, 0x0371, 0x0372, 0x0373, 0x0374, 0x0375, 0x0376, 0x0377,
    0x0378, 0x0379, 0x037a, 0x037b, 0x037c, 0x037d, 0x037e, 0x037f,
    0x0380, 0x0381, 0x0382, 0x0383, 0x0384, 0x0385, 0x03ac, 0x0387,
    0x03ad, 0x03ae, 0x03af, 0x038b, 0x03cc, 0x038d, 0x03cd, 0x03ce,
    0x0390, 0x03b1, 0x03b2, 0x03b3, 0x03b4, 0x03b5, 0x03b6, 0x03b7,
    0x03b8, 0x03b9, 0x03ba, 0x03bb, 0x03bc, 0x03bd, 0x03be, 0x03bf,
    0x03c0, 0x03c1, 0x03a2, 0x03c3, 0x03c4, 0x03c5, 0x03c6, 0x03c7,
    0x03c8, 0x03c9, 0x03ca, 0x03cb, 0x03ac, 0x03ad, 0x03ae, 0x03af,
    0x03b0, 0x03b1, 0x03b2, 0x03b3, 0x03b4, 0x03b5, 0x03b6, 0x03b7,
    0x03b8, 0x03b9, 0x03ba, 0x03bb, 0x03bc, 0x03bd, 0x03be, 0x03bf,
    0x03c0, 0x03c1, 0x03c2, 0x03c3, 0x03c4, 0x03c5, 0x03c6, 0x03c7,
    0x03c8, 0x03c9, 0x03ca, 0x03cb, 0x03cc, 0x03cd, 0x03ce, 0x03cf,
    0x03d0, 0x03d1, 0x03d2, 0x03d3, 0x03d4, 0x03d5, 0x03d6, 0x03d7,
    0x03d9, 0x03d9, 0x03db, 0x03db, 0x03dd, 0x03dd, 0x03df, 0x03df,
    0x03e1, 0x03e1, 0x03e3, 0x03e3, 0x03e5, 0x03e5, 0x03e7, 0x03e7,
    0x03e9, 0x03e9, 0x03eb, 0x03eb, 0x03ed, 0x03ed, 0x03ef, 0x03ef,
    0x03f0, 0x03f1, 0x03f2, 0x03f3, 0x03b8, 0x03f5, 0x03f6, 0x03f7,
    0x03f8, 0x03f9, 0x03fa, 0x03fb, 0x03fc, 0x03fd, 0x03fe, 0x03ff,
};

// Greek Extended, U+1F00..U+1FFF
constexpr std::uint16_t kGreekExtUpper[] = {
    0x1f08, 0x1f09, 0x1f0a, 0x1f0b, 0x1f0c, 0x1f0d, 0x1f0e, 0x1f0f,
    0x1f08, 0x1f09, 0x1f0a, 0x1f0b, 0x1f0c, 0x1f0d, 0x1f0e, 0x1f0f,
    0x1f18, 0x1f19, 0x1f1a, 0x1f1b, 0x1f1c, 0x1f1d, 0x1f16, 0x1f17,
    0x1f18, 0x1f19, 0x1f1a, 0x1f1b, 0x1f1c, 0x1f1d, 0x1f1e, 0x1f1f,
    0x1f28, 0x1f29, 0x1f2a, 0x1f2b, 0x1f2c, 0x1f2d, 0x1f2e, 0x1f2f,
    0x1f28, 0x1f29, 0x1f2a, 0x1f2b, 0x1f2c, 0x1f2d, 0x1f2e, 0x1f2f,
    0x1f38, 0x1f39, 0x1f3a, 0x1f3b, 0x1f3c, 0x1f3d, 0x1f3e, 0x1f3f,
    0x1f38, 0x1f39, 0x1f3a, 0x1f3b, 0x1f3c, 0x1f3d, 0x1f3e, 0x1f3f,
    0x1f48, 0x1f49, 0x1f4a, 0x1f4b, 0x1f4c, 0x1f4d, 0x1f46, 0x1f47,
    0x1f48, 0x1f49, 0x1f4a, 0x1f4b, 0x1f4c, 0x1f4d, 0x1f4e, 0x1f4f,
    0x1f50, 0x1f59, 0x1f52, 0x1f5b, 0x1f54, 0x1f5d, 0x1f56, 0x1f5f,
    0x1f58, 0x1f59, 0x1f5a, 0x1f5b, 0x1f5c, 0x1f5d, 0x1f5e, 0x1f5f,
    0x1f68, 0x1f69, 0x1f6a, 0x1f6b, 0x1f6c, 0x1f6d, 0x1f6e, 0x1f6f,
    0x1f68, 0x1f69, 0x1f6a, 0x1f6b, 0x1f6c, 0x1f6d, 0x1f6e, 0x1f6f,
    0x1fba, 0x1fbb, 0x1fc8, 0x1fc9, 0x1fca, 0x1fcb, 0x1fda, 0x1fdb,
    0x1ff8, 0x1ff9, 0x1fea, 0x1feb, 0x1ffa, 0x1ffb, 0x1f7e, 0x1f7f,
    0x1f88, 0x1f89, 0x1f8a, 0x1f8b, 0x1f8c, 0x1f8d, 0x1f8e, 0x1f8f,
    0x1f88, 0x1f89, 0x1f8a, 0x1f8b, 0x1f8c, 0x1f8d, 0x1f8e, 0x1f8f,
    0x1f98, 0x1f99, 0x1f9a, 0x1f9b, 0x1f9c, 0x1f9d, 0x1f9e, 0x1f9f,
    0x1f98, 0x1f99, 0x1f9a, 0x1f9b, 0x1f9c, 0x1f9d, 0x1f9e, 0x1f9f,
    0x1fa8, 0x1fa9, 0x1faa, 0x1fab, 0x1fac, 0x1fad, 0x1fae, 0x1faf,
    0x1fa8, 0x1fa9, 0x1faa, 0x1fab, 0x1fac, 0x1fad, 0x1fae, 0x1faf,
    0x1fb8, 0x1fb9, 0x1fb2, 0x1fbc, 0x1fb4, 0x1fb5, 0x1fb6, 0x1fb7,
    0x1fb8, 0x1fb9, 0x1fba, 0x1fbb, 0x1fbc, 0x1fbd, 0x0399, 0x1fbf,
    0x1fc0, 0x1fc1, 0x1fc2, 0x1fcc, 0x1fc4, 0x1fc5, 0x1fc6, 0x1fc7,
    0x1fc8, 0x1fc9, 0x1fca, 0x1fcb, 0x1fcc, 0x1fcd, 0x1fce, 0x1fcf,
    0x1fd8, 0x1fd9, 0x1fd2, 0x1fd3, 0x1fd4, 0x1fd5, 0x1fd6, 0x1fd7,
    0x1fd8, 0x1fd9, 0x1fda, 0x1fdb, 0x1fdc, 0x1fdd, 0x1fde, 0x1fdf,
    0x1fe8, 0x1fe9, 0x1fe2, 0x1fe3, 0x1fe4, 0x1fec, 0x1fe6, 0x1fe7,
    0x1fe8, 0x1fe9, 0x1fea, 0x1feb, 0x1fec, 0x1fed, 0x1fee, 0x1fef,
    0x1ff0, 0x1ff1, 0x1ff2, 0x1ffc, 0x1ff4, 0x1ff5, 0x1ff6, 0x1ff7,
    0x1ff8, 0x1ff9, 0x1ffa, 0x1ffb, 0x1ffc, 0x1ffd, 0x1ffe, 0x1fff,
};

constexpr std::uint16_t kGreekExtLower[] = {
    0x1f00, 0x1f01, 0x1f02, 0x1f03, 0x1f04, 0x1f05, 0x1f06, 0x1f07,
    0x1f00, 0x1f01, 0x1f02, 0x1f03, 0x1f04, 0x1f05, 0x1f06, 0x1f07,
    0x1f10, 0x1f11, 0x1f12, 0x1f13, 0x1f14, 0x1f15, 0x1f16, 0x1f17,
    0x1f10, 0x1f11, 0x1f12, 0x1f13, 0x1f14, 0x1f15, 0x1f1e, 0x1f1f,
    0x1f20, 0x1f21, 0x1f22, 0x1f23, 0x1f24, 0x1f25, 0x1f26, 0x1f27,
    0x1f20, 0x1f21, 0x1f22, 0x1f23, 0x1f24, 0x1f25, 0x1f26, 0x1f27,
    0x1f30, 0x1f31, 0x1f32, 0x1f33, 0x1f34, 0x1f35, 0x1f36, 0x1f37,
    0x1f30, 0x1f31, 0x1f32, 0x1f33, 0x1f34, 0x1f35, 0x1f36, 0x1f37,
    0x1f40, 0x1f41, 0x1f42, 0x1f43, 0x1f44, 0x1f45, 0x1f46, 0x1f47,
    0x1f40, 0x1f41, 0x1f42, 0x1f43, 0x1f44, 0x1f45, 0x1f4e, 0x1f4f,
    0x1f50, 0x1f51, 0x1f52, 0x1f53, 0x1f54, 0x1f55, 0x1f56, 0x1f57,
    0x1f58, 0x1f51, 0x1f5a, 0x1f53, 0x1f5c, 0x1f55, 0x1f5e, 0x1f57,
    0x1f60, 0x1f61, 0x1f62, 0x1f63, 0x1f64, 0x1f65, 0x1f66, 0x1f67,
    0x1f60, 0x1f61, 0x1f62, 0x1f63, 0x1f64, 0x1f65, 0x1f66, 0x1f67,
    0x1f70, 0x1f71, 0x1f72, 0x1f73, 0x1f74, 0x1f75, 0x1f76, 0x1f77,
    0x1f78, 0x1f79, 0x1f7a, 0x1f7b, 0x1f7c, 0x1f7d, 0x1f7e, 0x1f7f,
    0x1f80, 0x1f81, 0x1f82, 0x1f83, 0x1f84, 0x1f85, 0x1f86, 0x1f87,
    0x1f80, 0x1f81, 0x1f82, 0x1f83, 0x1f84, 0x1f85, 0x1f86, 0x1f87,
    0x1f90, 0x1f91, 0x1f92, 0x1f93, 0x1f94, 0x1f95, 0x1f96, 0x1f97,
    0x1f90, 0x1f91, 0x1f92, 0x1f93, 0x1f94, 0x1f95, 0x1f96, 0x1f97,
    0x1fa0, 0x1fa1, 0x1fa2, 0x1fa3, 0x1fa4, 0x1fa5, 0x1fa6, 0x1fa7,
    0x1fa0, 0x1fa1, 0x1fa2, 0x1fa3, 0x1fa4, 0x1fa5, 0x1fa6, 0x1fa7,
    0x1fb0, 0x1fb1, 0x1fb2, 0x1fb3, 0x1fb4, 0x1fb5, 0x1fb6, 0x1fb7,
    0x1fb0, 0x1fb1, 0x1f70, 0x1f71, 0x1fb3, 0x1fbd, 0x1fbe, 0x1fbf,
    0x1fc0, 0x1fc1, 0x1fc2, 0x1fc3, 0x1fc4, 0x1fc5, 0x1fc6, 0x1fc7,
    0x1f72, 0x1f73, 0x1f74, 0x1f75, 0x1fc3, 0x1fcd, 0x1fce, 0x1fcf,
    0x1fd0, 0x1fd1, 0x1fd2, 0x1fd3, 0x1fd4, 0x1fd5, 0x1fd6, 0x1fd7,
    0x1fd0, 0x1fd1, 0x1f76, 0x1f77, 0x1fdc, 0x1fdd, 0x1fde, 0x1fdf,
    0x1fe0, 0x1fe1, 0x1fe2, 0x1fe3, 0x1fe4, 0x1fe5, 0x1fe6, 0x1fe7,
    0x1fe0, 0x1fe1, 0x1f7a, 0x1f7b, 0x1fe5, 0x1fed, 0x1fee, 0x1fef,
    0x1ff0, 0x1ff1, 0x1ff2, 0x1ff3, 0x1ff4, 0x1ff5, 0x1ff6, 0x1ff7,
    0x1f78, 0x1f79, 0x1f7c, 0x1f7d, 0x1ff3, 0x1ffd, 0x1ffe, 0x1fff,
};

/**
 * Case mapping of a Unicode code point. Ranges are disjoint; each one uses
 * arithmetic offsets, even/odd pairing or one of the tables above.
 */
void convertUnicodeCase(std::uint32_t code, std::uint32_t& lower, std::uint32_t& upper) {
    lower = code;
    upper = code;

    // Basic Latin and Latin-1 Supplement
    if (code < 0x100) {
        if (code >= 0x41 && code <= 0x5a) {
            lower += 0x20;
        } else if (code >= 0x61 && code <= 0x7a) {
            upper -= 0x20;
        } else if ((code >= 0xc0 && code <= 0xd6) || (code >= 0xd8 && code <= 0xde)) {
            lower += 0x20;
        } else if ((code >= 0xe0 && code <= 0xf6) || (code >= 0xf8 && code <= 0xfe)) {
            upper -= 0x20;
        } else if (code == 0xff) {
            upper = 0x178;
        } else if (code == 0xb5) {
            upper = 0x39c;
        }
        return;
    }

    // Latin Extended-A
    if (code >= 0x100 && code <= 0x17f) {
        if ((code >= 0x100 && code <= 0x12f) ||
            (code >= 0x132 && code <= 0x137) ||
            (code >= 0x14a && code <= 0x177)) {
            if (code & 1) {
                upper -= 1;
            } else {
                lower += 1;
            }
        } else if ((code >= 0x139 && code <= 0x148) || (code >= 0x179 && code <= 0x17e)) {
            if (code & 1) {
                lower += 1;
            } else {
                upper -= 1;
            }
        } else if (code == 0x130) {
            lower = 0x69;
        } else if (code == 0x131) {
            upper = 0x49;
        } else if (code == 0x178) {
            lower = 0xff;
        } else if (code == 0x17f) {
            upper = 0x53;
        }
        return;
    }

    // Latin Extended-B
    if (code >= 0x180 && code <= 0x24f) {
        if (code >= 0x1cd && code <= 0x1dc) {
            if (code & 1) {
                lower += 1;
            } else {
                upper -= 1;
            }
        } else if ((code >= 0x1de && code <= 0x1ef) ||
                   (code >= 0x1f4 && code <= 0x1f5) ||
                   (code >= 0x1f8 && code <= 0x21f) ||
                   (code >= 0x222 && code <= 0x233)) {
            if (code & 1) {
                upper -= 1;
            } else {
                lower += 1;
            }
        } else if (code >= 0x180 && code <= 0x1cc) {
            lower = kLatinExtBLower[code - 0x180];
            upper = kLatinExtBUpper[code - 0x180];
        } else if (code == 0x1dd) {
            upper = 0x18e;
        } else if (code == 0x1f1 || code == 0x1f2) {
            lower = 0x1f3;
            upper = 0x1f1;
        } else if (code == 0x1f3) {
            upper = 0x1f1;
        } else if (code == 0x1f6) {
            lower = 0x195;
        } else if (code == 0x1f7) {
            lower = 0x1bf;
        } else if (code == 0x220) {
            lower = 0x19e;
        }
        return;
    }

    // IPA Extensions
    if (code >= 0x253 && code <= 0x292) {
        upper = kIpaUpper[code - 0x253];
        return;
    }

    // Combining ypogegrammeni
    if (code == 0x345) {
        upper = 0x399;
        return;
    }

    // Greek and Coptic
    if (code >= 0x370 && code <= 0x3ff) {
        lower = kGreekLower[code - 0x370];
        upper = kGreekUpper[code - 0x370];
        return;
    }

    // Cyrillic and Cyrillic Supplement
    if (code >= 0x400 && code <= 0x52f) {
        if (code <= 0x40f) {
            lower += 0x50;
        } else if (code <= 0x42f) {
            lower += 0x20;
        } else if (code <= 0x44f) {
            upper -= 0x20;
        } else if (code <= 0x45f) {
            upper -= 0x50;
        } else if ((code >= 0x460 && code <= 0x481) ||
                   (code >= 0x48a && code <= 0x4bf) ||
                   (code >= 0x4d0 && code <= 0x4f5) ||
                   (code >= 0x4f8 && code <= 0x4f9) ||
                   (code >= 0x500 && code <= 0x50f)) {
            if (code & 1) {
                upper -= 1;
            } else {
                lower += 1;
            }
        } else if (code >= 0x4c1 && code <= 0x4ce) {
            if (code & 1) {
                lower += 1;
            } else {
                upper -= 1;
            }
        }
        return;
    }

    // Armenian
    if (code >= 0x530 && code <= 0x58f) {
        if (code >= 0x531 && code <= 0x556) {
            lower += 0x30;
        } else if (code >= 0x561 && code <= 0x586) {
            upper -= 0x30;
        }
        return;
    }

    // Latin Extended Additional
    if (code >= 0x1e00 && code <= 0x1eff) {
        if ((code >= 0x1e00 && code <= 0x1e95) || (code >= 0x1ea0 && code <= 0x1ef9)) {
            if (code & 1) {
                upper -= 1;
            } else {
                lower += 1;
            }
        } else if (code == 0x1e9b) {
            upper = 0x1e60;
        }
        return;
    }

    // Greek Extended
    if (code >= 0x1f00 && code <= 0x1fff) {
        lower = kGreekExtLower[code - 0x1f00];
        upper = kGreekExtUpper[code - 0x1f00];
        return;
    }

    // Letterlike Symbols
    if (code >= 0x2100 && code <= 0x214f) {
        if (code == 0x2126) {
            lower = 0x3c9;
        } else if (code == 0x212a) {
            lower = 0x6b;
        } else if (code == 0x212b) {
            lower = 0xe5;
        }
        return;
    }

    // Number Forms
    if (code >= 0x2160 && code <= 0x216f) {
        lower += 0x10;
    } else if (code >= 0x2170 && code <= 0x217f) {
        upper -= 0x10;
    }
    // Enclosed Alphanumerics
    else if (code >= 0x24b6 && code <= 0x24cf) {
        lower += 0x1a;
    } else if (code >= 0x24d0 && code <= 0x24e9) {
        upper -= 0x1a;
    }
    // Halfwidth and Fullwidth Forms
    else if (code >= 0xff21 && code <= 0xff3a) {
        lower += 0x20;
    } else if (code >= 0xff41 && code <= 0xff5a) {
        upper -= 0x20;
    }
    // Deseret
    else if (code >= 0x10400 && code <= 0x10427) {
        lower += 0x28;
    } else if (code >= 0x10428 && code <= 0x1044f) {
        upper -= 0x28;
    }
}

constexpr protocol::Keysym UNICODE_KEYSYM_FLAG = 0x01000000;

}

void convertCase(protocol::Keysym symbol, protocol::Keysym& lower, protocol::Keysym& upper) {
    // Latin-1 keysyms equal their code points
    if (symbol < 0x100) {
        convertUnicodeCase(symbol, lower, upper);
        return;
    }

    if ((symbol & 0xff000000) == UNICODE_KEYSYM_FLAG) {
        convertUnicodeCase(symbol & 0x00ffffff, lower, upper);
        lower |= UNICODE_KEYSYM_FLAG;
        upper |= UNICODE_KEYSYM_FLAG;
        return;
    }

    lower = symbol;
    upper = symbol;

    // Legacy keysym blocks, selected by the high byte
    switch (symbol >> 8) {
        case 1:  // Latin 2
            if (symbol == XK_Aogonek) {
                lower = XK_aogonek;
            } else if (symbol >= XK_Lstroke && symbol <= XK_Sacute) {
                lower += XK_lstroke - XK_Lstroke;
            } else if (symbol >= XK_Scaron && symbol <= XK_Zacute) {
                lower += XK_scaron - XK_Scaron;
            } else if (symbol >= XK_Zcaron && symbol <= XK_Zabovedot) {
                lower += XK_zcaron - XK_Zcaron;
            } else if (symbol == XK_aogonek) {
                upper = XK_Aogonek;
            } else if (symbol >= XK_lstroke && symbol <= XK_sacute) {
                upper -= XK_lstroke - XK_Lstroke;
            } else if (symbol >= XK_scaron && symbol <= XK_zacute) {
                upper -= XK_scaron - XK_Scaron;
            } else if (symbol >= XK_zcaron && symbol <= XK_zabovedot) {
                upper -= XK_zcaron - XK_Zcaron;
            } else if (symbol >= XK_Racute && symbol <= XK_Tcedilla) {
                lower += XK_racute - XK_Racute;
            } else if (symbol >= XK_racute && symbol <= XK_tcedilla) {
                upper -= XK_racute - XK_Racute;
            }
            break;

        case 2:  // Latin 3
            if (symbol >= XK_Hstroke && symbol <= XK_Hcircumflex) {
                lower += XK_hstroke - XK_Hstroke;
            } else if (symbol >= XK_Gbreve && symbol <= XK_Jcircumflex) {
                lower += XK_gbreve - XK_Gbreve;
            } else if (symbol >= XK_hstroke && symbol <= XK_hcircumflex) {
                upper -= XK_hstroke - XK_Hstroke;
            } else if (symbol >= XK_gbreve && symbol <= XK_jcircumflex) {
                upper -= XK_gbreve - XK_Gbreve;
            } else if (symbol >= XK_Cabovedot && symbol <= XK_Scircumflex) {
                lower += XK_cabovedot - XK_Cabovedot;
            } else if (symbol >= XK_cabovedot && symbol <= XK_scircumflex) {
                upper -= XK_cabovedot - XK_Cabovedot;
            }
            break;

        case 3:  // Latin 4
            if (symbol >= XK_Rcedilla && symbol <= XK_Tslash) {
                lower += XK_rcedilla - XK_Rcedilla;
            } else if (symbol >= XK_rcedilla && symbol <= XK_tslash) {
                upper -= XK_rcedilla - XK_Rcedilla;
            } else if (symbol == XK_ENG) {
                lower = XK_eng;
            } else if (symbol == XK_eng) {
                upper = XK_ENG;
            } else if (symbol >= XK_Amacron && symbol <= XK_Umacron) {
                lower += XK_amacron - XK_Amacron;
            } else if (symbol >= XK_amacron && symbol <= XK_umacron) {
                upper -= XK_amacron - XK_Amacron;
            }
            break;

        case 6:  // Cyrillic
            if (symbol >= XK_Serbian_DJE && symbol <= XK_Serbian_DZE) {
                lower -= XK_Serbian_DJE - XK_Serbian_dje;
            } else if (symbol >= XK_Serbian_dje && symbol <= XK_Serbian_dze) {
                upper += XK_Serbian_DJE - XK_Serbian_dje;
            } else if (symbol >= XK_Cyrillic_YU && symbol <= XK_Cyrillic_HARDSIGN) {
                lower -= XK_Cyrillic_YU - XK_Cyrillic_yu;
            } else if (symbol >= XK_Cyrillic_yu && symbol <= XK_Cyrillic_hardsign) {
                upper += XK_Cyrillic_YU - XK_Cyrillic_yu;
            }
            break;

        case 7:  // Greek
            if (symbol >= XK_Greek_ALPHAaccent && symbol <= XK_Greek_OMEGAaccent) {
                lower += XK_Greek_alphaaccent - XK_Greek_ALPHAaccent;
            } else if (symbol >= XK_Greek_alphaaccent && symbol <= XK_Greek_omegaaccent &&
                       symbol != XK_Greek_iotaaccentdieresis &&
                       symbol != XK_Greek_upsilonaccentdieresis) {
                upper -= XK_Greek_alphaaccent - XK_Greek_ALPHAaccent;
            } else if (symbol >= XK_Greek_ALPHA && symbol <= XK_Greek_OMEGA) {
                lower += XK_Greek_alpha - XK_Greek_ALPHA;
            } else if (symbol >= XK_Greek_alpha && symbol <= XK_Greek_omega &&
                       symbol != XK_Greek_finalsmallsigma) {
                upper -= XK_Greek_alpha - XK_Greek_ALPHA;
            }
            break;

        case 0x13:  // Latin 9
            if (symbol == XK_OE) {
                lower = XK_oe;
            } else if (symbol == XK_oe) {
                upper = XK_OE;
            } else if (symbol == XK_Ydiaeresis) {
                lower = XK_ydiaeresis;
            }
            break;

        default:
            break;
    }
}

}
