////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include "exports.hpp"
#include "value.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Forward declaration from OpenSSL
struct evp_cipher_ctx_st;

PIXWIRE__NAMESPACE_BEGIN

enum class cipher_mode: std::uint8_t
{
      cbc
    , ctr
    , cfb
};

constexpr std::size_t CIPHER_IV_SIZE = 16;
constexpr std::size_t CIPHER_BLOCK_SIZE = 16;
constexpr std::size_t DEFAULT_KEY_SALT_SIZE = 64;
constexpr int DEFAULT_KEY_SIZE = 32;
constexpr int MIN_KEY_STRETCH_ITERATIONS = 1000;
constexpr int MAX_KEY_STRETCH_ITERATIONS = 1000000;
constexpr int DEFAULT_KEY_STRETCH_ITERATIONS = 1000;

struct cipher_params
{
    cipher_mode mode {cipher_mode::cbc};
    std::vector<char> iv;
    std::vector<char> key_data; // Secret, never advertised
    std::vector<char> key_salt;
    std::string key_hash {"SHA1"};
    int key_size {DEFAULT_KEY_SIZE};
    int key_stretch_iterations {DEFAULT_KEY_STRETCH_ITERATIONS};

    // true  - one running context per direction
    // false - random IV prepended to every frame
    bool stream {true};
};

/**
 * Generates @a n cryptographically strong random bytes.
 *
 * @throws error {errc::unexpected_error} on random generator failure.
 */
PIXWIRE__EXPORT std::vector<char> random_bytes (std::size_t n);

/**
 * Makes parameters with random IV and salt.
 *
 * @param cipher_name One of "AES", "AES-CBC", "AES-CTR", "AES-CFB".
 *
 * @throws error {errc::invalid_argument} on unsupported cipher name.
 */
PIXWIRE__EXPORT cipher_params make_cipher_params (std::string const & cipher_name
    , std::vector<char> key_data);

/**
 * Capabilities the peer needs to build the matching inbound context (the key is not included).
 */
PIXWIRE__EXPORT value make_cipher_caps (cipher_params const & params);

/**
 * Parses peer cipher capabilities.
 *
 * @throws error {errc::invalid_argument} on missing or unsupported settings.
 */
PIXWIRE__EXPORT cipher_params parse_cipher_caps (value const & caps, std::vector<char> key_data);

PIXWIRE__EXPORT char const * to_string (cipher_mode mode) noexcept;

/**
 * Symmetric cipher context for one direction.
 */
class cipher_state
{
public:
    enum class direction { encrypt, decrypt };

private:
    evp_cipher_ctx_st * _ctx {nullptr};
    cipher_params _params;
    direction _dir;
    std::vector<unsigned char> _key;
    std::string _name;

public:
    /**
     * @throws error {errc::invalid_argument} on invalid parameters.
     * @throws error {errc::unexpected_error} on cipher backend failure.
     */
    PIXWIRE__EXPORT cipher_state (cipher_params params, direction dir);
    PIXWIRE__EXPORT ~cipher_state ();

    cipher_state (cipher_state const &) = delete;
    cipher_state & operator = (cipher_state const &) = delete;

public:
    /**
     * Cipher name, e.g. "AES-CBC".
     */
    std::string const & name () const noexcept
    {
        return _name;
    }

    /**
     * Padding block size: 16 for CBC, 0 for stream modes.
     */
    std::size_t block_size () const noexcept
    {
        return _params.mode == cipher_mode::cbc ? CIPHER_BLOCK_SIZE : 0;
    }

    cipher_params const & params () const noexcept
    {
        return _params;
    }

    /**
     * Pads (block modes) and encrypts @a data.
     */
    PIXWIRE__EXPORT std::vector<char> encrypt (char const * data, std::size_t n);

    /**
     * Decrypts @a data and checks and strips the padding (block modes).
     *
     * @throws error {errc::decryption_error} on invalid length or padding. The error message
     *         contains sizes only.
     */
    PIXWIRE__EXPORT std::vector<char> decrypt (char const * data, std::size_t n);

private:
    void init_context (unsigned char const * iv);
};

/**
 * Appends PKCS#7 padding: 1..@a block_size bytes, each holding the pad length.
 */
PIXWIRE__EXPORT void pad (std::vector<char> & data, std::size_t block_size);

/**
 * Checks and strips PKCS#7 padding.
 *
 * @return @c false if padding is invalid, @a data is unchanged then.
 */
PIXWIRE__EXPORT bool unpad (std::vector<char> & data, std::size_t block_size) noexcept;

PIXWIRE__NAMESPACE_END
