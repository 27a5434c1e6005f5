// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <stdexcept>
#include <string>

namespace audiotap {

/**
 * @brief Base exception class for all audiotap errors
 *
 * All audiotap-specific exceptions derive from this class, making it easy
 * to catch all capture errors with a single catch block.
 */
class audiotap_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Audio device related errors
 *
 * Thrown when device operations fail, such as:
 * - No default device available
 * - Device not found
 * - Backend not initialized
 */
class device_error : public audiotap_error {
public:
    using audiotap_error::audiotap_error;
};

/**
 * @brief Audio format related errors
 *
 * Thrown when the device delivers samples the pipeline cannot normalize:
 * - Unsupported sample encoding
 * - Zero channels
 */
class format_error : public audiotap_error {
public:
    using audiotap_error::audiotap_error;
};

/**
 * @brief Sample-rate converter construction errors
 *
 * Thrown when the rate pair or block sizes cannot be expressed by the
 * spectral resampler.
 */
class converter_error : public audiotap_error {
public:
    using audiotap_error::audiotap_error;
};

/**
 * @brief Hardware stream errors
 *
 * Thrown when a capture stream cannot be opened or started.
 */
class stream_error : public audiotap_error {
public:
    using audiotap_error::audiotap_error;
};

/**
 * @brief Configuration errors
 */
class config_error : public audiotap_error {
public:
    using audiotap_error::audiotap_error;
};

/**
 * @brief I/O related errors (file output)
 */
class io_error : public audiotap_error {
public:
    using audiotap_error::audiotap_error;
};

} // namespace audiotap

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
