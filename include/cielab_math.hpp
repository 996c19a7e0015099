#pragma once

#include <vector>
#include <cmath>
#include <algorithm>
#include <cstdint>
#include <array>
#include <limits>

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
#define RETROPALETTE_X86 1
#include <immintrin.h>
#if defined(__GNUC__) || defined(__clang__)
#include <cpuid.h>
#endif
#if defined(_MSC_VER)
#include <intrin.h>
#endif
#endif

#if defined(RETROPALETTE_X86) && (defined(__GNUC__) || defined(__clang__))
#define RETROPALETTE_TARGET_AVX2 __attribute__((target("avx2")))
#else
#define RETROPALETTE_TARGET_AVX2
#endif

struct LabColor {
    double L = 0.0;
    double a = 0.0;
    double b = 0.0;
};

namespace Cielab {

    // -----------------------------
    // Reference white (D65) and matrices
    // -----------------------------

    static constexpr double XN = 0.95047;
    static constexpr double YN = 1.0;
    static constexpr double ZN = 1.08883;

    static constexpr double SRGB_TO_XYZ[9] = {
        0.4124564, 0.3575761, 0.1804375,
        0.2126729, 0.7151522, 0.0721750,
        0.0193339, 0.1191920, 0.9503041
    };

    static constexpr double XYZ_TO_SRGB[9] = {
         3.2404542, -1.5371385, -0.4985314,
        -0.9692660,  1.8760108,  0.0415560,
         0.0556434, -0.2040259,  1.0572252
    };

    static constexpr double LAB_DELTA = 6.0 / 29.0;

    // -----------------------------
    // Runtime CPU feature detection
    // -----------------------------

    static inline bool cpu_has_avx2() {
#if defined(RETROPALETTE_X86) && (defined(__GNUC__) || defined(__clang__))
        unsigned int eax, ebx, ecx, edx;
        if (!__get_cpuid_max(0, nullptr)) return false;
        if (!__get_cpuid_count(7, 0, &eax, &ebx, &ecx, &edx)) return false;
        return (ebx & (1u << 5)) != 0; // AVX2 bit in leaf 7.ebx bit 5
#elif defined(RETROPALETTE_X86) && defined(_MSC_VER)
        int info[4];
        __cpuid(info, 0);
        int nIds = info[0];
        if (nIds >= 7) {
            __cpuidex(info, 7, 0);
            return (info[1] & (1 << 5)) != 0;
        }
        return false;
#else
        return false;
#endif
    }

    static inline bool cpu_has_avx2_cached() {
        static const bool has = cpu_has_avx2();
        return has;
    }

    // -----------------------------
    // Transfer functions
    // -----------------------------

    // lazy initialized once
    static inline const std::array<double, 256>& srgb8_to_linear_table() {
        static const std::array<double, 256> table = [] {
            std::array<double, 256> t{};
            for (int i = 0; i < 256; ++i) {
                double v = i / 255.0;
                t[i] = (v <= 0.04045) ? v / 12.92 : std::pow((v + 0.055) / 1.055, 2.4);
            }
            return t;
        }();
        return table;
    }

    static inline double linear_to_srgb(double c) {
        return (c <= 0.0031308) ? c * 12.92 : 1.055 * std::pow(c, 1.0 / 2.4) - 0.055;
    }

    static inline double clamp01(double v) {
        if (std::isnan(v)) return 0.0;
        return std::clamp(v, 0.0, 1.0);
    }

    static inline double lab_f(double t) {
        return (t > LAB_DELTA * LAB_DELTA * LAB_DELTA) ? std::cbrt(t) : t / (3.0 * LAB_DELTA * LAB_DELTA) + 4.0 / 29.0;
    }

    static inline double lab_f_inv(double t) {
        return (t > LAB_DELTA) ? t * t * t : 3.0 * LAB_DELTA * LAB_DELTA * (t - 4.0 / 29.0);
    }

    // -----------------------------
    // Per-color conversions
    // -----------------------------

    inline LabColor RgbToLab(uint8_t r, uint8_t g, uint8_t b) {
        const auto& lut = srgb8_to_linear_table();
        const double lr = lut[r], lg = lut[g], lb = lut[b];

        const double x = SRGB_TO_XYZ[0] * lr + SRGB_TO_XYZ[1] * lg + SRGB_TO_XYZ[2] * lb;
        const double y = SRGB_TO_XYZ[3] * lr + SRGB_TO_XYZ[4] * lg + SRGB_TO_XYZ[5] * lb;
        const double z = SRGB_TO_XYZ[6] * lr + SRGB_TO_XYZ[7] * lg + SRGB_TO_XYZ[8] * lb;

        const double fx = lab_f(x / XN);
        const double fy = lab_f(y / YN);
        const double fz = lab_f(z / ZN);

        LabColor lab;
        lab.L = 116.0 * fy - 16.0;
        lab.a = 500.0 * (fx - fy);
        lab.b = 200.0 * (fy - fz);
        return lab;
    }

    inline void LabToRgb(const LabColor& lab, uint8_t rgb[3]) {
        const double fy = (lab.L + 16.0) / 116.0;
        const double fx = fy + lab.a / 500.0;
        const double fz = fy - lab.b / 200.0;

        const double x = XN * lab_f_inv(fx);
        const double y = YN * lab_f_inv(fy);
        const double z = ZN * lab_f_inv(fz);

        const double lin[3] = {
            XYZ_TO_SRGB[0] * x + XYZ_TO_SRGB[1] * y + XYZ_TO_SRGB[2] * z,
            XYZ_TO_SRGB[3] * x + XYZ_TO_SRGB[4] * y + XYZ_TO_SRGB[5] * z,
            XYZ_TO_SRGB[6] * x + XYZ_TO_SRGB[7] * y + XYZ_TO_SRGB[8] * z
        };
        for (int c = 0; c < 3; ++c) {
            double v = clamp01(linear_to_srgb(clamp01(lin[c])));
            rgb[c] = static_cast<uint8_t>(std::lround(v * 255.0));
        }
    }

    // -----------------------------
    // Distances
    // -----------------------------

    inline double DeltaE76(const LabColor& p, const LabColor& q) {
        const double dl = p.L - q.L, da = p.a - q.a, db = p.b - q.b;
        return std::sqrt(dl * dl + da * da + db * db);
    }

    inline double DeltaE2000(const LabColor& p, const LabColor& q) {
        constexpr double kPi = 3.14159265358979323846;
        constexpr double kPow25_7 = 6103515625.0; // 25^7
        auto deg2rad = [](double d) { return d * kPi / 180.0; };
        auto rad2deg = [](double r) { return r * 180.0 / kPi; };

        const double c1 = std::hypot(p.a, p.b);
        const double c2 = std::hypot(q.a, q.b);
        const double cBar = 0.5 * (c1 + c2);
        const double cBar7 = std::pow(cBar, 7.0);
        const double g = 0.5 * (1.0 - std::sqrt(cBar7 / (cBar7 + kPow25_7)));

        const double a1p = (1.0 + g) * p.a;
        const double a2p = (1.0 + g) * q.a;
        const double c1p = std::hypot(a1p, p.b);
        const double c2p = std::hypot(a2p, q.b);

        auto hueAngle = [&](double bb, double ap) {
            if (bb == 0.0 && ap == 0.0) return 0.0;
            double h = rad2deg(std::atan2(bb, ap));
            return h < 0.0 ? h + 360.0 : h;
        };
        const double h1p = hueAngle(p.b, a1p);
        const double h2p = hueAngle(q.b, a2p);

        const double dLp = q.L - p.L;
        const double dCp = c2p - c1p;

        double dhp = 0.0;
        const double cProd = c1p * c2p;
        if (cProd != 0.0) {
            dhp = h2p - h1p;
            if (dhp > 180.0) dhp -= 360.0;
            else if (dhp < -180.0) dhp += 360.0;
        }
        const double dHp = 2.0 * std::sqrt(cProd) * std::sin(deg2rad(dhp) / 2.0);

        const double lBarP = 0.5 * (p.L + q.L);
        const double cBarP = 0.5 * (c1p + c2p);

        double hBarP = h1p + h2p;
        if (cProd != 0.0) {
            if (std::fabs(h1p - h2p) <= 180.0) hBarP = 0.5 * (h1p + h2p);
            else if (h1p + h2p < 360.0) hBarP = 0.5 * (h1p + h2p + 360.0);
            else hBarP = 0.5 * (h1p + h2p - 360.0);
        }

        const double t = 1.0
            - 0.17 * std::cos(deg2rad(hBarP - 30.0))
            + 0.24 * std::cos(deg2rad(2.0 * hBarP))
            + 0.32 * std::cos(deg2rad(3.0 * hBarP + 6.0))
            - 0.20 * std::cos(deg2rad(4.0 * hBarP - 63.0));

        const double dTheta = 30.0 * std::exp(-std::pow((hBarP - 275.0) / 25.0, 2.0));
        const double cBarP7 = std::pow(cBarP, 7.0);
        const double rc = 2.0 * std::sqrt(cBarP7 / (cBarP7 + kPow25_7));
        const double lTerm = (lBarP - 50.0) * (lBarP - 50.0);
        const double sl = 1.0 + (0.015 * lTerm) / std::sqrt(20.0 + lTerm);
        const double sc = 1.0 + 0.045 * cBarP;
        const double sh = 1.0 + 0.015 * cBarP * t;
        const double rt = -std::sin(deg2rad(2.0 * dTheta)) * rc;

        const double vl = dLp / sl;
        const double vc = dCp / sc;
        const double vh = dHp / sh;
        return std::sqrt(vl * vl + vc * vc + vh * vh + rt * vc * vh);
    }

    // -----------------------------
    // SoA palette for nearest-entry search
    // -----------------------------

    // Lab palette laid out as three float lanes, padded to a multiple of 8 with
    // far-away sentinels so the AVX2 loop never needs a tail.
    struct LabPaletteSoA {
        std::vector<float> L, A, B;
        size_t size = 0;

        LabPaletteSoA() = default;

        explicit LabPaletteSoA(const std::vector<LabColor>& entries) { Assign(entries); }

        void Assign(const std::vector<LabColor>& entries) {
            size = entries.size();
            const size_t padded = (size + 7) & ~size_t(7);
            L.assign(padded, 1.0e6f);
            A.assign(padded, 1.0e6f);
            B.assign(padded, 1.0e6f);
            for (size_t i = 0; i < size; ++i) {
                L[i] = static_cast<float>(entries[i].L);
                A[i] = static_cast<float>(entries[i].a);
                B[i] = static_cast<float>(entries[i].b);
            }
        }

        size_t Padded() const { return L.size(); }
    };

    // Returns the index of the nearest entry (squared CIE76); ties go to the lowest index.
    inline size_t NearestIndex_Scalar(const LabPaletteSoA& pal, float l, float a, float b, float* outDistSq = nullptr) {
        float best = std::numeric_limits<float>::max();
        size_t bestIdx = 0;
        for (size_t i = 0; i < pal.size; ++i) {
            const float dl = pal.L[i] - l;
            const float da = pal.A[i] - a;
            const float db = pal.B[i] - b;
            const float d = (dl * dl + da * da) + db * db;
            if (d < best) { best = d; bestIdx = i; }
        }
        if (outDistSq) *outDistSq = best;
        return bestIdx;
    }

#if defined(RETROPALETTE_X86)
    RETROPALETTE_TARGET_AVX2
    inline size_t NearestIndex_AVX2(const LabPaletteSoA& pal, float l, float a, float b, float* outDistSq = nullptr) {
        const __m256 vl = _mm256_set1_ps(l);
        const __m256 va = _mm256_set1_ps(a);
        const __m256 vb = _mm256_set1_ps(b);
        __m256 bestD = _mm256_set1_ps(std::numeric_limits<float>::max());
        __m256i bestI = _mm256_set1_epi32(0);
        __m256i idx = _mm256_setr_epi32(0, 1, 2, 3, 4, 5, 6, 7);
        const __m256i step = _mm256_set1_epi32(8);

        // No FMA here so the lane distances match the scalar path bit for bit.
        for (size_t i = 0; i < pal.Padded(); i += 8) {
            __m256 dl = _mm256_sub_ps(_mm256_loadu_ps(&pal.L[i]), vl);
            __m256 da = _mm256_sub_ps(_mm256_loadu_ps(&pal.A[i]), va);
            __m256 db = _mm256_sub_ps(_mm256_loadu_ps(&pal.B[i]), vb);
            __m256 d = _mm256_add_ps(_mm256_add_ps(_mm256_mul_ps(dl, dl), _mm256_mul_ps(da, da)), _mm256_mul_ps(db, db));
            __m256 lt = _mm256_cmp_ps(d, bestD, _CMP_LT_OQ);
            bestD = _mm256_blendv_ps(bestD, d, lt);
            bestI = _mm256_castps_si256(_mm256_blendv_ps(_mm256_castsi256_ps(bestI), _mm256_castsi256_ps(idx), lt));
            idx = _mm256_add_epi32(idx, step);
        }

        alignas(32) float d8[8];
        alignas(32) int32_t i8[8];
        _mm256_store_ps(d8, bestD);
        _mm256_store_si256(reinterpret_cast<__m256i*>(i8), bestI);
        float best = d8[0];
        int32_t bestIdx = i8[0];
        for (int k = 1; k < 8; ++k) {
            if (d8[k] < best || (d8[k] == best && i8[k] < bestIdx)) { best = d8[k]; bestIdx = i8[k]; }
        }
        if (outDistSq) *outDistSq = best;
        return static_cast<size_t>(bestIdx);
    }
#endif

    // -----------------------------
    // Public wrapper: runtime pick AVX2 or scalar
    // -----------------------------

    inline size_t NearestIndex(const LabPaletteSoA& pal, float l, float a, float b, float* outDistSq = nullptr) {
        if (pal.size == 0) {
            if (outDistSq) *outDistSq = std::numeric_limits<float>::max();
            return 0;
        }
#if defined(RETROPALETTE_X86)
        if (cpu_has_avx2_cached()) return NearestIndex_AVX2(pal, l, a, b, outDistSq);
#endif
        return NearestIndex_Scalar(pal, l, a, b, outDistSq);
    }

    inline size_t NearestIndex(const LabPaletteSoA& pal, const LabColor& lab, float* outDistSq = nullptr) {
        return NearestIndex(pal, static_cast<float>(lab.L), static_cast<float>(lab.a), static_cast<float>(lab.b), outDistSq);
    }

} // namespace Cielab
