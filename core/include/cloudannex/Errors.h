// Errors.h — исключения CloudAnnex
// NotFound исключением не является: поиск возвращает nullptr / std::nullopt

#pragma once

#include "Types.h"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace CloudAnnex {

/// Базовое исключение всех операций с удалённым хранилищем
class CloudAnnexException : public std::runtime_error {
public:
    CloudAnnexException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

/// В папке больше одного элемента с одинаковым именем
class AmbiguousNameError : public CloudAnnexException {
public:
    AmbiguousNameError(const std::string& parentId, const std::string& name)
        : CloudAnnexException(ErrorKind::Ambiguous,
                              "Two or more entries named '" + name + "' in folder " + parentId),
          m_name(name) {}

    const std::string& name() const noexcept { return m_name; }

private:
    std::string m_name;
};

/// Операция ожидала папку, а нашла файл (или наоборот)
class TypeConflictError : public CloudAnnexException {
public:
    explicit TypeConflictError(const std::string& message)
        : CloudAnnexException(ErrorKind::TypeConflict, message) {}
};

class AlreadyExistsError : public CloudAnnexException {
public:
    explicit AlreadyExistsError(const std::string& name)
        : CloudAnnexException(ErrorKind::AlreadyExists, "Entry already exists: " + name) {}
};

/// Дайджест, подтверждённый сервером, не совпал с локальным.
/// confirmedOffset — последняя проверенная позиция, с неё можно продолжить.
class ChecksumMismatchError : public CloudAnnexException {
public:
    ChecksumMismatchError(const std::string& expected, const std::string& actual,
                          int64_t confirmedOffset)
        : CloudAnnexException(ErrorKind::ChecksumMismatch,
                              "Checksum mismatch at offset " + std::to_string(confirmedOffset) +
                                  ": remote " + expected + ", local " + actual),
          m_expected(expected), m_actual(actual), m_confirmedOffset(confirmedOffset) {}

    const std::string& expected() const noexcept { return m_expected; }
    const std::string& actual() const noexcept { return m_actual; }
    int64_t confirmedOffset() const noexcept { return m_confirmedOffset; }

private:
    std::string m_expected;
    std::string m_actual;
    int64_t m_confirmedOffset;
};

/// Ошибка транспорта. status == 0 — запрос не дошёл до сервера.
class TransportError : public CloudAnnexException {
public:
    TransportError(int status, const std::string& message, const std::string& body = "")
        : CloudAnnexException(ErrorKind::Transport,
                              status > 0 ? "HTTP " + std::to_string(status) + ": " + message
                                         : message),
          m_status(status), m_body(body) {}

    int status() const noexcept { return m_status; }
    const std::string& body() const noexcept { return m_body; }

private:
    int m_status;
    std::string m_body;
};

class UnsupportedOperationError : public CloudAnnexException {
public:
    explicit UnsupportedOperationError(const std::string& message)
        : CloudAnnexException(ErrorKind::UnsupportedOperation, message) {}
};

class LocalIoError : public CloudAnnexException {
public:
    explicit LocalIoError(const std::string& message)
        : CloudAnnexException(ErrorKind::LocalIo, message) {}
};

} // namespace CloudAnnex
