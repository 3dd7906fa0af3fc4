////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/cipher.hpp"
#include "pfs/pixwire/error.hpp"
#include "pfs/pixwire/tag.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>
#include <pfs/numeric_cast.hpp>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <limits>

PIXWIRE__NAMESPACE_BEGIN

static std::string openssl_error_text ()
{
    char buf[256];
    auto code = ERR_get_error();

    if (code == 0)
        return std::string{"unknown error"};

    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string{buf};
}

static EVP_MD const * digest_by_name (std::string const & name)
{
    if (name == "SHA1")
        return EVP_sha1();

    if (name == "SHA224")
        return EVP_sha224();

    if (name == "SHA256")
        return EVP_sha256();

    if (name == "SHA384")
        return EVP_sha384();

    if (name == "SHA512")
        return EVP_sha512();

    return nullptr;
}

static EVP_CIPHER const * evp_cipher (cipher_mode mode, int key_size)
{
    switch (mode) {
        case cipher_mode::cbc:
            return key_size == 16 ? EVP_aes_128_cbc()
                : key_size == 24 ? EVP_aes_192_cbc() : EVP_aes_256_cbc();
        case cipher_mode::ctr:
            return key_size == 16 ? EVP_aes_128_ctr()
                : key_size == 24 ? EVP_aes_192_ctr() : EVP_aes_256_ctr();
        case cipher_mode::cfb:
            return key_size == 16 ? EVP_aes_128_cfb128()
                : key_size == 24 ? EVP_aes_192_cfb128() : EVP_aes_256_cfb128();
    }

    return nullptr;
}

static void throw_invalid_params (std::string const & msg)
{
    throw error {make_error_code(errc::invalid_argument), msg};
}

static void validate (cipher_params const & params)
{
    if (params.key_data.empty())
        throw_invalid_params(tr::_("encryption key is empty"));

    if (params.key_size != 16 && params.key_size != 24 && params.key_size != 32)
        throw_invalid_params(tr::f_("invalid key size: {}", params.key_size));

    if (params.key_stretch_iterations < MIN_KEY_STRETCH_ITERATIONS
            || params.key_stretch_iterations > MAX_KEY_STRETCH_ITERATIONS) {
        throw_invalid_params(tr::f_("invalid number of key stretching iterations: {}"
            " (must be between {} and {})", params.key_stretch_iterations
            , MIN_KEY_STRETCH_ITERATIONS, MAX_KEY_STRETCH_ITERATIONS));
    }

    if (digest_by_name(params.key_hash) == nullptr)
        throw_invalid_params(tr::f_("unsupported key hash: {}", params.key_hash));

    if (params.key_salt.empty())
        throw_invalid_params(tr::_("key salt is empty"));

    if (params.iv.size() != CIPHER_IV_SIZE)
        throw_invalid_params(tr::f_("invalid IV size: {}", params.iv.size()));
}

std::vector<char> random_bytes (std::size_t n)
{
    std::vector<char> result(n);

    if (n > 0) {
        auto rc = RAND_bytes(reinterpret_cast<unsigned char *>(result.data())
            , pfs::numeric_cast<int>(n));

        if (rc != 1) {
            throw error {
                  make_error_code(errc::unexpected_error)
                , tr::f_("random bytes generation failure: {}", openssl_error_text())
            };
        }
    }

    return result;
}

static bool parse_cipher_name (std::string const & name, cipher_mode & mode)
{
    if (name == "AES" || name == "AES-CBC") {
        mode = cipher_mode::cbc;
        return true;
    }

    if (name == "AES-CTR") {
        mode = cipher_mode::ctr;
        return true;
    }

    if (name == "AES-CFB") {
        mode = cipher_mode::cfb;
        return true;
    }

    return false;
}

cipher_params make_cipher_params (std::string const & cipher_name, std::vector<char> key_data)
{
    cipher_params params;

    if (!parse_cipher_name(cipher_name, params.mode))
        throw_invalid_params(tr::f_("unsupported cipher: {}", cipher_name));

    params.iv = random_bytes(CIPHER_IV_SIZE);
    params.key_salt = random_bytes(DEFAULT_KEY_SALT_SIZE);
    params.key_data = std::move(key_data);
    return params;
}

char const * to_string (cipher_mode mode) noexcept
{
    switch (mode) {
        case cipher_mode::cbc:
            return "CBC";
        case cipher_mode::ctr:
            return "CTR";
        case cipher_mode::cfb:
            return "CFB";
    }

    return "<unknown>";
}

value make_cipher_caps (cipher_params const & params)
{
    auto caps = value::make_dict();
    caps.set("cipher", "AES");
    caps.set("mode", to_string(params.mode));
    caps.set("iv", value {params.iv});
    caps.set("key_salt", value {params.key_salt});
    caps.set("key_hash", params.key_hash);
    caps.set("key_size", params.key_size);
    caps.set("key_stretch", "PBKDF2");
    caps.set("key_stretch_iterations", params.key_stretch_iterations);
    caps.set("padding", params.mode == cipher_mode::cbc ? "PKCS#7" : "none");
    caps.set("stream", params.stream);
    return caps;
}

static value const & required_cap (value const & caps, std::string const & key)
{
    auto v = caps.find(key);

    if (v == nullptr)
        throw_invalid_params(tr::f_("missing cipher capability: {}", key));

    return *v;
}

cipher_params parse_cipher_caps (value const & caps, std::vector<char> key_data)
{
    if (!caps.is_dict())
        throw_invalid_params(tr::_("cipher capabilities must be a dictionary"));

    cipher_params params;

    auto name = required_cap(caps, "cipher").to_text();
    auto mode_cap = caps.find("mode");

    if (mode_cap != nullptr && name == "AES")
        name += "-" + mode_cap->to_text();

    if (!parse_cipher_name(name, params.mode))
        throw_invalid_params(tr::f_("unsupported cipher: {}", name));

    auto stretch = caps.find("key_stretch");

    if (stretch != nullptr && stretch->to_text() != "PBKDF2")
        throw_invalid_params(tr::f_("unsupported key stretching: {}", stretch->to_text()));

    auto const & iv = required_cap(caps, "iv");
    params.iv = iv.is_bytes() ? iv.as_bytes() : value::make_bytes(iv.to_text()).as_bytes();

    auto const & salt = required_cap(caps, "key_salt");
    params.key_salt = salt.is_bytes() ? salt.as_bytes()
        : value::make_bytes(salt.to_text()).as_bytes();

    if (auto v = caps.find("key_hash"))
        params.key_hash = v->to_text();

    if (auto v = caps.find("key_size"))
        params.key_size = static_cast<int>(v->as_integer());

    params.key_stretch_iterations = static_cast<int>(
        required_cap(caps, "key_stretch_iterations").as_integer());

    if (auto v = caps.find("stream"))
        params.stream = v->as_boolean();

    params.key_data = std::move(key_data);
    validate(params);
    return params;
}

cipher_state::cipher_state (cipher_params params, direction dir)
    : _params(std::move(params))
    , _dir(dir)
{
    validate(_params);

    _name = std::string{"AES-"} + to_string(_params.mode);
    _key.resize(static_cast<std::size_t>(_params.key_size));

    auto rc = PKCS5_PBKDF2_HMAC(_params.key_data.data()
        , pfs::numeric_cast<int>(_params.key_data.size())
        , reinterpret_cast<unsigned char const *>(_params.key_salt.data())
        , pfs::numeric_cast<int>(_params.key_salt.size())
        , _params.key_stretch_iterations
        , digest_by_name(_params.key_hash)
        , _params.key_size, _key.data());

    if (rc != 1) {
        throw error {
              make_error_code(errc::unexpected_error)
            , tr::f_("key stretching failure: {}", openssl_error_text())
        };
    }

    // The key is no longer needed in its raw form
    std::fill(_params.key_data.begin(), _params.key_data.end(), '\0');
    _params.key_data.clear();

    _ctx = EVP_CIPHER_CTX_new();

    if (_ctx == nullptr) {
        throw error {
              make_error_code(errc::unexpected_error)
            , tr::f_("cipher context allocation failure: {}", openssl_error_text())
        };
    }

    try {
        init_context(reinterpret_cast<unsigned char const *>(_params.iv.data()));
    } catch (...) {
        EVP_CIPHER_CTX_free(_ctx);
        _ctx = nullptr;
        throw;
    }

    LOGD(CRYPTO_TAG, "{} {} context initialized: key size={}, key hash={}, iterations={}, stream={}"
        , _name, (_dir == direction::encrypt ? "encrypt" : "decrypt"), _params.key_size
        , _params.key_hash, _params.key_stretch_iterations, _params.stream);
}

cipher_state::~cipher_state ()
{
    std::fill(_key.begin(), _key.end(), 0);

    if (_ctx != nullptr)
        EVP_CIPHER_CTX_free(_ctx);
}

void cipher_state::init_context (unsigned char const * iv)
{
    auto cipher = evp_cipher(_params.mode, _params.key_size);

    auto rc = _dir == direction::encrypt
        ? EVP_EncryptInit_ex(_ctx, cipher, nullptr, _key.data(), iv)
        : EVP_DecryptInit_ex(_ctx, cipher, nullptr, _key.data(), iv);

    if (rc != 1) {
        throw error {
              make_error_code(errc::unexpected_error)
            , tr::f_("{} context initialization failure: {}", _name, openssl_error_text())
        };
    }

    // Padding is done explicitly so the frame length is known before encryption
    EVP_CIPHER_CTX_set_padding(_ctx, 0);
}

std::vector<char> cipher_state::encrypt (char const * data, std::size_t n)
{
    std::vector<char> plain(data, data + n);

    if (block_size() > 0)
        pad(plain, block_size());

    std::vector<char> result;
    std::size_t offset = 0;

    if (!_params.stream) {
        result = random_bytes(CIPHER_IV_SIZE);
        offset = CIPHER_IV_SIZE;
        init_context(reinterpret_cast<unsigned char const *>(result.data()));
    }

    result.resize(offset + plain.size() + CIPHER_BLOCK_SIZE);
    int outlen = 0;

    auto rc = EVP_EncryptUpdate(_ctx, reinterpret_cast<unsigned char *>(result.data() + offset)
        , & outlen, reinterpret_cast<unsigned char const *>(plain.data())
        , pfs::numeric_cast<int>(plain.size()));

    if (rc != 1) {
        throw error {
              make_error_code(errc::unexpected_error)
            , tr::f_("{} encryption failure of {} bytes: {}", _name, plain.size()
                , openssl_error_text())
        };
    }

    result.resize(offset + static_cast<std::size_t>(outlen));
    return result;
}

std::vector<char> cipher_state::decrypt (char const * data, std::size_t n)
{
    if (!_params.stream) {
        if (n < CIPHER_IV_SIZE) {
            throw error {
                  make_error_code(errc::decryption_error)
                , tr::f_("{}: encrypted frame is too short: {} bytes", _name, n)
            };
        }

        init_context(reinterpret_cast<unsigned char const *>(data));
        data += CIPHER_IV_SIZE;
        n -= CIPHER_IV_SIZE;
    }

    if (block_size() > 0 && (n == 0 || n % block_size() != 0)) {
        throw error {
              make_error_code(errc::decryption_error)
            , tr::f_("{}: encrypted size {} is not a multiple of the block size {}"
                , _name, n, block_size())
        };
    }

    if (n > static_cast<std::size_t>((std::numeric_limits<int>::max)())) {
        throw error {
              make_error_code(errc::decryption_error)
            , tr::f_("{}: encrypted frame is too large: {} bytes", _name, n)
        };
    }

    std::vector<char> result(n + CIPHER_BLOCK_SIZE);
    int outlen = 0;

    auto rc = EVP_DecryptUpdate(_ctx, reinterpret_cast<unsigned char *>(result.data())
        , & outlen, reinterpret_cast<unsigned char const *>(data), pfs::numeric_cast<int>(n));

    if (rc != 1) {
        throw error {
              make_error_code(errc::decryption_error)
            , tr::f_("{} decryption failure of {} bytes", _name, n)
        };
    }

    result.resize(static_cast<std::size_t>(outlen));

    if (block_size() > 0 && !unpad(result, block_size())) {
        std::fill(result.begin(), result.end(), '\0');

        throw error {
              make_error_code(errc::decryption_error)
            , tr::f_("{}: invalid padding in frame of {} bytes", _name, n)
        };
    }

    return result;
}

void pad (std::vector<char> & data, std::size_t block_size)
{
    auto padlen = block_size - data.size() % block_size;
    data.insert(data.end(), padlen, static_cast<char>(padlen));
}

bool unpad (std::vector<char> & data, std::size_t block_size) noexcept
{
    if (data.empty() || block_size == 0)
        return false;

    auto padlen = static_cast<std::size_t>(static_cast<std::uint8_t>(data.back()));

    if (padlen == 0 || padlen > block_size || padlen > data.size())
        return false;

    for (auto i = data.size() - padlen; i < data.size(); i++) {
        if (static_cast<std::size_t>(static_cast<std::uint8_t>(data[i])) != padlen)
            return false;
    }

    data.resize(data.size() - padlen);
    return true;
}

PIXWIRE__NAMESPACE_END
