/*
 *  Client interface for local Gree device access
 *
 *  Error codes shared by all layers
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _greeErrors
#define _greeErrors

namespace Gree {
  namespace Error {
    enum value {
      NONE,
      CRYPTO,             // base64 or AES failure
      SERIALIZATION,      // malformed JSON
      PROTOCOL,           // well formed message of the wrong shape
      IO,                 // socket failure
      TIMEOUT,            // no response within deadline
      NOT_FOUND,          // unknown device or alias
      NOT_BOUND,          // operation needs a session key
      INVALID_VARIABLE,   // name not in the catalog (or not writable)
      INVALID_VALUE,      // value outside the variable's domain
      CONFIG              // rejected configuration
    }; // enum value

    const char* name(const value error);

    // Status code a front end must answer with for this error
    int http_status(const value error);

    // Timeouts and socket errors are worth retrying, everything else is not
    bool is_transient(const value error);
  }; // namespace Error
}; // namespace Gree

#endif // _greeErrors
