#include "storage/gf256.hh"

namespace shardkeep {

const GF256::Tables& GF256::tables() {
    static const Tables built = [] {
        Tables t;
        std::uint16_t x = 1;
        for (int i = 0; i < 255; i++) {
            t.exp[i] = static_cast<element_type>(x);
            t.log[x] = static_cast<element_type>(i);

            x <<= 1;
            if (x & 0x100) {
                x ^= GF_PRIMITIVE_POLY;
            }
        }

        // Doubled exp table so log(a) + log(b) never needs a modulo
        for (int i = 255; i < 512; i++) {
            t.exp[i] = t.exp[i - 255];
        }

        t.log[0] = 0;  // Convention (undefined mathematically)
        return t;
    }();
    return built;
}

void GF256::initialize() {
    (void)tables();
}

GF256::element_type GF256::mul(element_type a, element_type b) {
    if (a == 0 || b == 0) return 0;
    const auto& t = tables();
    return t.exp[t.log[a] + t.log[b]];
}

GF256::element_type GF256::div(element_type a, element_type b) {
    if (a == 0 || b == 0) return 0;
    const auto& t = tables();
    return t.exp[t.log[a] + 255 - t.log[b]];
}

GF256::element_type GF256::pow(element_type a, std::size_t n) {
    if (n == 0) return 1;
    if (a == 0) return 0;
    const auto& t = tables();
    return t.exp[(static_cast<std::size_t>(t.log[a]) * n) % 255];
}

GF256::element_type GF256::inv(element_type a) {
    if (a == 0) return 0;
    const auto& t = tables();
    return t.exp[255 - t.log[a]];
}

GF256::element_type GF256::exp(std::size_t i) {
    return tables().exp[i % 255];
}

}  // namespace shardkeep
