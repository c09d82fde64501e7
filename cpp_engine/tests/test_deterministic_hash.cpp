#include <cassert>
#include <string>
#include <vector>

#include "engine/deterministic_hash.hpp"

using namespace parlay::engine;

int main() {
    // Known values for this offset basis (platform independent).
    assert(fnv1a64("SIM#1#42") == 6924961391117258329ULL);
    assert(fnv1a64("leg-001") == 5756056782224471123ULL);
    assert(fnv1a64("") == 1469598103934665603ULL);
    assert(hex64(0x2aULL) == "000000000000002a");

    const std::string fp = fingerprint_ids({"b", "a", "c"}, "profile=balanced");
    assert(fp.rfind("fnv1a64:", 0) == 0);
    assert(fp.size() == 8 + 16);

    // Order-insensitive over ids.
    assert(fp == fingerprint_ids({"c", "b", "a"}, "profile=balanced"));
    // Context participates.
    assert(fp != fingerprint_ids({"a", "b", "c"}, "profile=premium"));
    // Separators keep concatenations apart.
    assert(fingerprint_ids({"ab", "c"}, "") != fingerprint_ids({"a", "bc"}, ""));
    return 0;
}
