// ============= include/core/errors.hpp =============
/*
 * Jerarquía de errores del motor
 *
 * Solo fallos reales son excepciones. Los resultados "normales"
 * (below_threshold, ambiguous_match, empty_gallery, already_marked)
 * viajan como valores en MatchResult / Decision.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace rollcall {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Payload malformado (JSON, data-URL, base64 o imagen no decodificable)
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& what) : Error(what) {}
};

class NoFaceDetected : public Error {
public:
    NoFaceDetected() : Error("No face detected in image") {}
};

class InvalidEmbedding : public Error {
public:
    explicit InvalidEmbedding(const std::string& what) : Error(what) {}
};

class InvalidIdentity : public Error {
public:
    explicit InvalidIdentity(const std::string& what) : Error(what) {}
};

class ProviderTimeout : public Error {
public:
    explicit ProviderTimeout(const std::string& what) : Error(what) {}
};

class ProviderError : public Error {
public:
    explicit ProviderError(const std::string& what) : Error(what) {}
};

class PersistenceError : public Error {
public:
    explicit PersistenceError(const std::string& what) : Error(what) {}
};

}  // namespace rollcall
