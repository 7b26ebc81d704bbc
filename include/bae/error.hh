// This is copyrighted software. More information is at the end of this file.
#pragma once

#include <stdexcept>
#include <string>

namespace bae {

/**
 * @brief Base exception class for all bae errors
 *
 * All bae-specific exceptions derive from this class, making it easy
 * to catch all bae errors with a single catch block.
 */
class bae_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Sample format related errors
 *
 * Thrown when format operations fail, such as:
 * - Reading the value of a failed conversion_result
 * - Encoding or decoding a track with an unknown audio_format
 */
class format_error : public bae_error {
public:
    using bae_error::bae_error;
};

} // namespace bae

/*
 * Copyright (C) 2025
 *
 * This file is part of bae.
 *
 * bae is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * bae is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with bae.  If not, see <http://www.gnu.org/licenses/>.
 */
