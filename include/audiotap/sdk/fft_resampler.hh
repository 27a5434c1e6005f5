/**
 * @file fft_resampler.hh
 * @brief Fixed-output spectral sample-rate converter
 * @ingroup sdk_resampling
 */

// This is copyrighted software. More information is at the end of this file.
#ifndef AUDIOTAP_SDK_FFT_RESAMPLER_HH
#define AUDIOTAP_SDK_FFT_RESAMPLER_HH

#include <cstddef>
#include <memory>
#include <audiotap/sdk/export_audiotap_sdk.h>
#include <audiotap/sdk/types.hh>

namespace audiotap {
    /**
     * @class fft_resampler
     * @brief Mono sample-rate converter working on fixed-size blocks
     * @ingroup sdk_resampling
     *
     * Converts audio from the device rate to the target rate in the frequency
     * domain. The rate pair is reduced by its greatest common divisor; the
     * converter processes FFT units of @c units*src/g input samples and emits
     * @c units*dst/g output samples per unit. Each unit is zero padded,
     * transformed, low-pass filtered (windowed sinc), truncated or extended to
     * the output spectrum size, inverse transformed and overlap-added.
     *
     * ## Block contract
     *
     * - input_block_length() is fixed at construction and never changes.
     * - convert() consumes exactly input_block_length() samples and returns
     *   between 0 and output_block_length() samples. 0 means the converted
     *   samples are kept until a full output block is available.
     *
     * ## Real-time use
     *
     * All buffers and FFT plans are created in the constructor; convert()
     * neither allocates nor throws and may run on the audio callback thread.
     *
     * @code
     * fft_resampler rs(48000, 16000, 1024);
     * std::vector<float> in(rs.input_block_length());
     * std::vector<float> out(rs.output_block_length());
     * // ... fill in ...
     * std::size_t n = rs.convert(in.data(), out.data());
     * @endcode
     */
    class AUDIOTAP_SDK_EXPORT fft_resampler {
        public:
            /**
             * @param src_rate Native device rate in Hz
             * @param dst_rate Target rate in Hz
             * @param chunk_size_out Desired output block length in samples
             * @param sub_chunks Number of FFT units the output block is split into
             *
             * @throws converter_error if a rate, the block length or the sub chunk
             *         count is zero, or the reduced rate ratio cannot be expressed
             *         with an output unit no longer than @p chunk_size_out
             */
            fft_resampler(sample_rate_t src_rate, sample_rate_t dst_rate,
                          std::size_t chunk_size_out, std::size_t sub_chunks = 2);
            ~fft_resampler();

            fft_resampler(const fft_resampler&) = delete;
            auto operator=(const fft_resampler&) -> fft_resampler& = delete;

            /**
             * @brief Exact number of samples each convert() call consumes
             */
            [[nodiscard]] std::size_t input_block_length() const noexcept;

            /**
             * @brief Maximum (and usual) number of samples convert() produces
             */
            [[nodiscard]] std::size_t output_block_length() const noexcept;

            /**
             * @brief Length of one FFT unit on the input side
             */
            [[nodiscard]] std::size_t fft_size_in() const noexcept;

            /**
             * @brief Length of one FFT unit on the output side
             */
            [[nodiscard]] std::size_t fft_size_out() const noexcept;

            [[nodiscard]] sample_rate_t src_rate() const noexcept;
            [[nodiscard]] sample_rate_t dst_rate() const noexcept;

            /**
             * @brief Convert one block
             * @param input Exactly input_block_length() samples
             * @param[out] output Room for output_block_length() samples
             * @return Number of samples written to @p output
             */
            std::size_t convert(const float input[], float output[]) noexcept;

            /**
             * @brief Drop filter history and pending output
             */
            void reset() noexcept;

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };
}

#endif

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
