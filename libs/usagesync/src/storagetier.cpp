#include "usagesync/storagetier.h"

QString storageErrorToString(StorageError error)
{
    switch (error) {
        case StorageError::None:        return "none";
        case StorageError::NotFound:    return "not found";
        case StorageError::DecodeError: return "decode error";
        case StorageError::WriteFailed: return "write failed";
    }
    return "unknown";
}
