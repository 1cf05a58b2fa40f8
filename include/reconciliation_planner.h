// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "sync_types.h"

#include <set>
#include <string>

namespace chitusync {

/**
 * @brief Pure diff of a local and a remote snapshot
 *
 * Rules, matched by filename:
 * - local only, or sizes differ: UPLOAD (overwrite, never delete+upload)
 * - remote only: DELETE, only when remote deletion is enabled
 * - same size: nothing
 *
 * All deletes come before all uploads. Within a category the order is by
 * name, which callers must not rely on.
 */
class ReconciliationPlanner {
  public:
    static ReconciliationPlan plan(const LocalSnapshot& local, const RemoteSnapshot& remote,
                                   bool remote_deletion);

    /**
     * @brief Plan restricted to a set of names touched by local events
     *
     * A name present locally always yields UPLOAD since its content may have
     * changed at the same size. A name gone locally yields DELETE when remote
     * deletion is enabled and @p remote is null (unknown) or lists it.
     */
    static ReconciliationPlan plan_for_names(const std::set<std::string>& names,
                                             const LocalSnapshot& local,
                                             const RemoteSnapshot* remote, bool remote_deletion);

    /// Stable sort putting every DELETE before every UPLOAD
    static void order(ReconciliationPlan& plan);
};

} // namespace chitusync
