// This is copyrighted software. More information is at the end of this file.
#include <audiotap/sdk/fft_resampler.hh>
#include <audiotap/error.hh>

#include <fftw3.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <numeric>
#include <string>
#include <vector>

namespace {
    // Largest FFT unit accepted on either side (samples)
    constexpr std::size_t MAX_FFT_UNIT = 1u << 20;

    // FFTW's planner is not thread safe; execution is.
    std::mutex s_planner_mutex;

    struct fftwf_deleter {
        void operator()(void* p) const noexcept { fftwf_free(p); }
    };

    using real_buffer = std::unique_ptr<float, fftwf_deleter>;
    using complex_buffer = std::unique_ptr<fftwf_complex, fftwf_deleter>;

    // Squared Blackman-Harris window over npoints
    std::vector<double> make_window(std::size_t npoints) {
        constexpr double pi = 3.14159265358979323846;
        std::vector<double> w(npoints);
        for (std::size_t n = 0; n < npoints; n++) {
            const double x = 2.0 * pi * static_cast<double>(n) / static_cast<double>(npoints);
            const double bh = 0.35875 - 0.48829 * std::cos(x) + 0.14128 * std::cos(2.0 * x) - 0.01168 * std::cos(3.0 * x);
            w[n] = bh * bh;
        }
        return w;
    }

    // Windowed sinc low-pass, cutoff relative to Nyquist, unity DC gain
    std::vector<double> make_lowpass(std::size_t npoints, double cutoff) {
        constexpr double pi = 3.14159265358979323846;
        const auto window = make_window(npoints);
        std::vector<double> taps(npoints);
        const double center = static_cast<double>(npoints / 2);
        double sum = 0.0;
        for (std::size_t n = 0; n < npoints; n++) {
            const double x = cutoff * (static_cast<double>(n) - center);
            const double sinc = (x == 0.0) ? 1.0 : std::sin(pi * x) / (pi * x);
            taps[n] = cutoff * sinc * window[n];
            sum += taps[n];
        }
        for (auto& t : taps) {
            t /= sum;
        }
        return taps;
    }
}

namespace audiotap {
    struct fft_resampler::impl final {
        sample_rate_t m_src_rate = 0;
        sample_rate_t m_dst_rate = 0;
        std::size_t m_chunk_size_out = 0;
        std::size_t m_fft_in = 0;
        std::size_t m_fft_out = 0;
        std::size_t m_units_per_block = 0;

        real_buffer m_time_in;        // 2 * fft_in
        complex_buffer m_spec_in;     // fft_in + 1
        complex_buffer m_filter;      // fft_in + 1
        complex_buffer m_spec_out;    // fft_out + 1
        real_buffer m_time_out;       // 2 * fft_out
        fftwf_plan m_forward = nullptr;
        fftwf_plan m_inverse = nullptr;

        std::vector<float> m_overlap;
        std::vector<float> m_pending;
        std::size_t m_pending_len = 0;

        ~impl();

        void plan(sample_rate_t src_rate, sample_rate_t dst_rate, std::size_t chunk_size_out, std::size_t sub_chunks);
        void build_filter();

        /* Resample one FFT unit of m_fft_in samples into m_fft_out samples,
         * overlap-adding the tail of the previous unit.
         */
        void resample_unit(const float* in, float* out) noexcept;
    };

    fft_resampler::impl::~impl() {
        std::lock_guard<std::mutex> lock(s_planner_mutex);
        if (m_forward) {
            fftwf_destroy_plan(m_forward);
        }
        if (m_inverse) {
            fftwf_destroy_plan(m_inverse);
        }
    }

    void fft_resampler::impl::plan(sample_rate_t src_rate, sample_rate_t dst_rate,
                                   std::size_t chunk_size_out, std::size_t sub_chunks) {
        if (src_rate == 0 || dst_rate == 0) {
            throw converter_error("Sample rates must be positive (source " + std::to_string(src_rate) +
                                  " Hz, target " + std::to_string(dst_rate) + " Hz)");
        }
        if (chunk_size_out == 0) {
            throw converter_error("Output block length must be positive");
        }
        if (sub_chunks == 0) {
            throw converter_error("Sub chunk count must be positive");
        }

        const auto g = std::gcd(src_rate, dst_rate);
        const std::size_t min_in = src_rate / g;
        const std::size_t min_out = dst_rate / g;
        if (min_out > chunk_size_out) {
            throw converter_error("Cannot resample " + std::to_string(src_rate) + " Hz to " +
                                  std::to_string(dst_rate) + " Hz with output blocks of " +
                                  std::to_string(chunk_size_out) + " samples");
        }

        const std::size_t wanted = std::max<std::size_t>(1, chunk_size_out / sub_chunks);
        const std::size_t units = std::max<std::size_t>(1, wanted / min_out);
        m_fft_out = units * min_out;
        m_fft_in = units * min_in;
        if (m_fft_in > MAX_FFT_UNIT || m_fft_out > MAX_FFT_UNIT) {
            throw converter_error("FFT unit too large for " + std::to_string(src_rate) + " Hz to " +
                                  std::to_string(dst_rate) + " Hz");
        }

        m_src_rate = src_rate;
        m_dst_rate = dst_rate;
        m_chunk_size_out = chunk_size_out;
        m_units_per_block = chunk_size_out / m_fft_out;

        m_time_in.reset(fftwf_alloc_real(2 * m_fft_in));
        m_spec_in.reset(fftwf_alloc_complex(m_fft_in + 1));
        m_filter.reset(fftwf_alloc_complex(m_fft_in + 1));
        m_spec_out.reset(fftwf_alloc_complex(m_fft_out + 1));
        m_time_out.reset(fftwf_alloc_real(2 * m_fft_out));
        if (!m_time_in || !m_spec_in || !m_filter || !m_spec_out || !m_time_out) {
            throw converter_error("Failed to allocate FFT buffers");
        }

        {
            std::lock_guard<std::mutex> lock(s_planner_mutex);
            m_forward = fftwf_plan_dft_r2c_1d(static_cast<int>(2 * m_fft_in), m_time_in.get(), m_spec_in.get(), FFTW_ESTIMATE);
            m_inverse = fftwf_plan_dft_c2r_1d(static_cast<int>(2 * m_fft_out), m_spec_out.get(), m_time_out.get(), FFTW_ESTIMATE);
        }
        if (!m_forward || !m_inverse) {
            throw converter_error("Failed to create FFT plans");
        }

        m_overlap.assign(m_fft_out, 0.0f);
        m_pending.assign(m_chunk_size_out + m_units_per_block * m_fft_out, 0.0f);
        m_pending_len = 0;

        build_filter();
    }

    void fft_resampler::impl::build_filter() {
        double cutoff = std::pow(0.4, 16.0 / static_cast<double>(m_fft_in));
        if (m_fft_in > m_fft_out) {
            cutoff *= static_cast<double>(m_fft_out) / static_cast<double>(m_fft_in);
        }
        const auto taps = make_lowpass(m_fft_in, cutoff);

        // The inverse transform is unnormalized; fold 1/N of the forward size in here
        const double scale = 1.0 / static_cast<double>(2 * m_fft_in);
        float* t = m_time_in.get();
        for (std::size_t n = 0; n < m_fft_in; n++) {
            t[n] = static_cast<float>(taps[n] * scale);
        }
        std::fill(t + m_fft_in, t + 2 * m_fft_in, 0.0f);

        fftwf_execute(m_forward);
        std::copy_n(m_spec_in.get(), m_fft_in + 1, m_filter.get());
    }

    void fft_resampler::impl::resample_unit(const float* in, float* out) noexcept {
        float* t = m_time_in.get();
        std::copy_n(in, m_fft_in, t);
        std::fill(t + m_fft_in, t + 2 * m_fft_in, 0.0f);
        fftwf_execute(m_forward);

        const std::size_t bins = (m_fft_in < m_fft_out) ? m_fft_in + 1 : m_fft_out;
        const fftwf_complex* x = m_spec_in.get();
        const fftwf_complex* h = m_filter.get();
        fftwf_complex* y = m_spec_out.get();
        for (std::size_t b = 0; b < bins; b++) {
            y[b][0] = x[b][0] * h[b][0] - x[b][1] * h[b][1];
            y[b][1] = x[b][0] * h[b][1] + x[b][1] * h[b][0];
        }
        for (std::size_t b = bins; b <= m_fft_out; b++) {
            y[b][0] = 0.0f;
            y[b][1] = 0.0f;
        }
        fftwf_execute(m_inverse);

        const float* r = m_time_out.get();
        for (std::size_t n = 0; n < m_fft_out; n++) {
            out[n] = r[n] + m_overlap[n];
            m_overlap[n] = r[m_fft_out + n];
        }
    }

    fft_resampler::fft_resampler(sample_rate_t src_rate, sample_rate_t dst_rate,
                                 std::size_t chunk_size_out, std::size_t sub_chunks)
        : m_pimpl(std::make_unique<impl>()) {
        m_pimpl->plan(src_rate, dst_rate, chunk_size_out, sub_chunks);
    }

    fft_resampler::~fft_resampler() = default;

    std::size_t fft_resampler::input_block_length() const noexcept {
        return m_pimpl->m_units_per_block * m_pimpl->m_fft_in;
    }

    std::size_t fft_resampler::output_block_length() const noexcept {
        return m_pimpl->m_chunk_size_out;
    }

    std::size_t fft_resampler::fft_size_in() const noexcept {
        return m_pimpl->m_fft_in;
    }

    std::size_t fft_resampler::fft_size_out() const noexcept {
        return m_pimpl->m_fft_out;
    }

    sample_rate_t fft_resampler::src_rate() const noexcept {
        return m_pimpl->m_src_rate;
    }

    sample_rate_t fft_resampler::dst_rate() const noexcept {
        return m_pimpl->m_dst_rate;
    }

    std::size_t fft_resampler::convert(const float input[], float output[]) noexcept {
        auto& p = *m_pimpl;
        for (std::size_t u = 0; u < p.m_units_per_block; u++) {
            p.resample_unit(input + u * p.m_fft_in, p.m_pending.data() + p.m_pending_len);
            p.m_pending_len += p.m_fft_out;
        }

        if (p.m_pending_len < p.m_chunk_size_out) {
            return 0;
        }
        std::copy_n(p.m_pending.data(), p.m_chunk_size_out, output);
        std::copy(p.m_pending.begin() + static_cast<std::ptrdiff_t>(p.m_chunk_size_out),
                  p.m_pending.begin() + static_cast<std::ptrdiff_t>(p.m_pending_len),
                  p.m_pending.begin());
        p.m_pending_len -= p.m_chunk_size_out;
        return p.m_chunk_size_out;
    }

    void fft_resampler::reset() noexcept {
        std::fill(m_pimpl->m_overlap.begin(), m_pimpl->m_overlap.end(), 0.0f);
        m_pimpl->m_pending_len = 0;
    }
}

/*
 * Copyright (C) 2025
 *
 * This file is part of audiotap.
 *
 * audiotap is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * audiotap is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with audiotap.  If not, see <http://www.gnu.org/licenses/>.
 */
