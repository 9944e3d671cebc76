/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sf/types.hpp"

namespace sf {

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:             return "none";
        case ErrorKind::InvalidUrl:       return "invalid-url";
        case ErrorKind::Resolve:          return "resolve";
        case ErrorKind::Connect:          return "connect";
        case ErrorKind::TlsSetup:         return "tls-setup";
        case ErrorKind::TlsHandshake:     return "tls-handshake";
        case ErrorKind::TlsVerify:        return "tls-verify";
        case ErrorKind::Io:               return "io";
        case ErrorKind::Protocol:         return "protocol";
        case ErrorKind::TooManyRedirects: return "too-many-redirects";
    }
    return "unknown";
}

} // namespace sf
