// SPDX-License-Identifier: MIT
// Image encoder.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <libheif/heif.h>

#include <memory>
#include <string>

/** Encoder plugin instance. */
class HeifEncoder {
public:
    /**
     * Constructor: take ownership of native encoder.
     * @param enc native encoder instance
     */
    explicit HeifEncoder(heif_encoder* enc);

    /**
     * Get encoder name.
     * @return human readable name
     */
    std::string name() const;

    /**
     * Set quality for lossy compression.
     * @param quality quality in range [0, 100]
     */
    void set_lossy_quality(int quality);

    /**
     * Enable or disable lossless compression.
     * @param lossless new state
     */
    void set_lossless(bool lossless);

    /**
     * Set encoder specific parameter.
     * @param name parameter name
     * @param value parameter value
     */
    void set_string_parameter(const std::string& name,
                              const std::string& value);
    void set_integer_parameter(const std::string& name, int value);
    void set_boolean_parameter(const std::string& name, bool value);

    /**
     * Get native encoder instance.
     * @return pointer to native encoder
     */
    heif_encoder* get() const { return encoder.get(); }

private:
    std::unique_ptr<heif_encoder, decltype(&heif_encoder_release)> encoder;
};
