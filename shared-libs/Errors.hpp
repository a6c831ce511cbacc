#pragma once
#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace unik {
    /// @brief Classe base di tutte le eccezioni lanciate dalla libreria
    class UUIDError : public std::runtime_error {
    public:
        explicit UUIDError(const std::string& message) : std::runtime_error(message) {}
    };

    enum class DecodeErrorKind {
        UnrecognizedVersion,
        UnrecognizedVariant,
        UnrecognizedDomain
    };

    /// @brief Il valore decodificato non è un UUID conforme (versione, variante o dominio sconosciuti)
    class DecodeError : public UUIDError {
    private:
        DecodeErrorKind mKind;

    public:
        DecodeError(DecodeErrorKind kind, const std::string& message) : UUIDError(message), mKind(kind) {}

        DecodeErrorKind getKind() const { return mKind; }
    };

    enum class ParseErrorKind {
        InvalidLength,
        InvalidCharacter,
        InvalidHexDigit
    };

    /// @brief La stringa in ingresso non rispetta il formato canonico
    class ParseError : public UUIDError {
    private:
        ParseErrorKind mKind;

    public:
        ParseError(ParseErrorKind kind, const std::string& message) : UUIDError(message), mKind(kind) {}

        ParseErrorKind getKind() const { return mKind; }
    };

    enum class GenerationErrorKind {
        UnsupportedPlatform,
        EntropySourceUnavailable,
        DigestFailure
    };

    /// @brief Una risorsa della piattaforma (id utente, MAC, entropia, digest) non è disponibile
    class GenerationError : public UUIDError {
    private:
        GenerationErrorKind mKind;

    public:
        GenerationError(GenerationErrorKind kind, const std::string& message) : UUIDError(message), mKind(kind) {}

        GenerationErrorKind getKind() const { return mKind; }
    };
}

#endif
