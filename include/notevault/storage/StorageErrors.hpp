#ifndef INCLUDE_NOTEVAULT_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_NOTEVAULT_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace notevault::storage
{

// Raised by the record store and the config files. The core turns these into VaultError values.
class StorageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A record with the same title already exists; nothing was written.
class DuplicateTitleError final : public StorageError
{
public:
    using StorageError::StorageError;
};

class StorageIOError final : public StorageError
{
public:
    using StorageError::StorageError;
};

// Config artifacts exist but do not decode (bad magic, truncation, missing companion file).
class ConfigParseError final : public StorageError
{
public:
    using StorageError::StorageError;
};

class ConfigIOError final : public StorageError
{
public:
    using StorageError::StorageError;
};

} // namespace notevault::storage

#endif // INCLUDE_NOTEVAULT_STORAGE_STORAGEERRORS_HPP
