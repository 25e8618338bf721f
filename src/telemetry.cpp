#include "linkstation/telemetry.hpp"

namespace linkstation {

const char* to_string(Quality q) {
    switch (q) {
        case Quality::Excellent: return "excellent";
        case Quality::Good:      return "good";
        case Quality::Fair:      return "fair";
        case Quality::Poor:      return "poor";
    }
    return "unknown";
}

const char* to_string(ServingRat r) {
    switch (r) {
        case ServingRat::Lte:   return "LTE";
        case ServingRat::NrSa:  return "NR5G-SA";
        case ServingRat::NrNsa: return "NR5G-NSA";
    }
    return "unknown";
}

} // namespace linkstation
