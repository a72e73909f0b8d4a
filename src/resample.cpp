#include "resample.hpp"
#include <algorithm>
#include <cmath>
#include <new>
#include <vector>

namespace {

struct Tap { int index; float weight; };

// For each destination sample along one axis, the source samples it covers
// and their normalized coverage.
std::vector<std::vector<Tap>> axis_taps(int src, int dst){
    std::vector<std::vector<Tap>> taps((size_t)dst);
    const double scale = (double)src / dst;
    for (int d = 0; d < dst; ++d) {
        double lo = d * scale, hi = (d + 1) * scale;
        if (scale < 1.0) {
            // Upscaling: cover one source pixel centred on the sample.
            double c = (d + 0.5) * scale - 0.5;
            lo = c; hi = c + 1.0;
        }
        int first = std::max(0, (int)std::floor(lo));
        int last = std::min(src - 1, (int)std::ceil(hi) - 1);
        double total = 0.0;
        auto& t = taps[(size_t)d];
        for (int s = first; s <= last; ++s) {
            double cover = std::min(hi, (double)s + 1) - std::max(lo, (double)s);
            if (cover <= 0) continue;
            t.push_back({s, (float)cover});
            total += cover;
        }
        if (t.empty()) {
            t.push_back({std::min(src - 1, std::max(0, (int)lo)), 1.0f});
            total = 1.0;
        }
        for (auto& tap : t) tap.weight = (float)(tap.weight / total);
    }
    return taps;
}

}  // namespace

bool resample_area(const PixelBuffer& src, int dw, int dh, PixelBuffer& out){
    if (!src.valid() || dw <= 0 || dh <= 0) return false;
    try {
        auto xt = axis_taps(src.width, dw);
        auto yt = axis_taps(src.height, dh);

        // Horizontal pass into a float buffer of dw x src.height.
        std::vector<float> mid((size_t)dw * (size_t)src.height * 4);
        for (int y = 0; y < src.height; ++y) {
            for (int x = 0; x < dw; ++x) {
                float acc[4] = {0, 0, 0, 0};
                for (const auto& t : xt[(size_t)x]) {
                    const uint8_t* p = src.at(t.index, y);
                    for (int c = 0; c < 4; ++c) acc[c] += p[c] * t.weight;
                }
                float* m = &mid[((size_t)y * (size_t)dw + (size_t)x) * 4];
                for (int c = 0; c < 4; ++c) m[c] = acc[c];
            }
        }

        PixelBuffer res(dw, dh);
        for (int y = 0; y < dh; ++y) {
            for (int x = 0; x < dw; ++x) {
                float acc[4] = {0, 0, 0, 0};
                for (const auto& t : yt[(size_t)y]) {
                    const float* m = &mid[((size_t)t.index * (size_t)dw + (size_t)x) * 4];
                    for (int c = 0; c < 4; ++c) acc[c] += m[c] * t.weight;
                }
                uint8_t* p = res.at(x, y);
                for (int c = 0; c < 4; ++c)
                    p[c] = (uint8_t)std::min(255.0f, std::max(0.0f, acc[c] + 0.5f));
            }
        }
        out = std::move(res);
        return true;
    } catch (const std::bad_alloc&) {
        return false;
    }
}
