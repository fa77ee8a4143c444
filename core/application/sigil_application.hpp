/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace sigil::application {

  /**
   * @class SigilApplication signing node interface
   */
  class SigilApplication {
   public:
    virtual ~SigilApplication() = default;

    /// Runs node until a shutdown signal
    /// @return process exit code
    virtual int run() = 0;
  };

}  // namespace sigil::application
