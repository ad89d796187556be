// SPDX-License-Identifier: MIT
// Image encoder.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "heifencoder.hpp"

#include "heiferror.hpp"
#include "log.hpp"

#include <format>
#include <stdexcept>

HeifEncoder::HeifEncoder(heif_encoder* enc)
    : encoder(enc, &heif_encoder_release)
{
    if (!encoder) {
        throw std::invalid_argument("Encoder is not specified");
    }
}

std::string HeifEncoder::name() const
{
    const char* str = heif_encoder_get_name(encoder.get());
    return str ? str : "";
}

void HeifEncoder::set_lossy_quality(int quality)
{
    if (quality < 0 || quality > 100) {
        throw std::out_of_range(
            std::format("Quality {} is out of range [0, 100]", quality));
    }
    HeifError::check(heif_encoder_set_lossy_quality(encoder.get(), quality));
}

void HeifEncoder::set_lossless(bool lossless)
{
    HeifError::check(heif_encoder_set_lossless(encoder.get(), lossless));
}

void HeifEncoder::set_string_parameter(const std::string& name,
                                       const std::string& value)
{
    Log::debug("Encoder parameter {}={}", name, value);
    HeifError::check(heif_encoder_set_parameter_string(
        encoder.get(), name.c_str(), value.c_str()));
}

void HeifEncoder::set_integer_parameter(const std::string& name, int value)
{
    Log::debug("Encoder parameter {}={}", name, value);
    HeifError::check(
        heif_encoder_set_parameter_integer(encoder.get(), name.c_str(), value));
}

void HeifEncoder::set_boolean_parameter(const std::string& name, bool value)
{
    Log::debug("Encoder parameter {}={}", name, value);
    HeifError::check(
        heif_encoder_set_parameter_boolean(encoder.get(), name.c_str(), value));
}
