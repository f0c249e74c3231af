#pragma once
#include <QString>
#include <stdexcept>

// Base for every failure raised by an instrument link or driver.
class InstrumentError : public std::runtime_error {
public:
    explicit InstrumentError(const QString &msg) : std::runtime_error(msg.toStdString()) {}
};

// The link could not be opened at all.
class ConnectionError : public InstrumentError {
public:
    explicit ConnectionError(const QString &msg) : InstrumentError(msg) {}
};

// The link dropped, or was used after it was closed.
class TransportError : public InstrumentError {
public:
    explicit TransportError(const QString &msg) : InstrumentError(msg) {}
};

// Rejected sweep/spectrum parameters, raised before touching any instrument.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const QString &msg) : std::invalid_argument(msg.toStdString()) {}
};
