// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-JAIL-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of Jail (sandboxed JavaScript cells for RPC clients).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE in the project root

#pragma once

#include "common/JailConfig.h"
#include "node/INodeManager.h"
#include <functional>
#include <mutex>

namespace JAIL {

/**
 * @brief Client handle handed to the jail
 *
 * The handle owns the backing client slot. Every call resolves the current
 * backing client, so the handle survives restart() without the jail noticing
 * and fails with NodeUnavailable once its manager is detached or destroyed.
 */
class RestartTolerantClient : public IRpcClient {
public:
    std::string call(const std::string &method, const json &params) override;

    void setBackend(std::shared_ptr<IRpcClient> backend);
    bool hasBackend() const;

    /**
     * @throws JailException(NodeUnavailable) when no backing client is set
     */
    std::shared_ptr<IRpcClient> currentBackend() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<IRpcClient> backend_;
};

/**
 * @brief Tracks the node the jail talks to
 *
 * attach() starts using a node endpoint, restart() swaps it for a new backing
 * client (old handles keep working), detach() forgets it. Handles outliving
 * the manager behave as detached.
 */
class NodeManager : public INodeManager {
public:
    using ClientFactory = std::function<std::shared_ptr<IRpcClient>(const NodeConfig &)>;

    /**
     * @param factory Builds the backing client for a node; HttpRpcClient when empty
     * @param hooks Hook policy handed to the jail; RequestContextHooks when null
     */
    explicit NodeManager(ClientFactory factory = nullptr, std::shared_ptr<IRequestHooks> hooks = nullptr);
    ~NodeManager() override;

    NodeManager(const NodeManager &) = delete;
    NodeManager &operator=(const NodeManager &) = delete;

    void attach(const NodeConfig &config);
    void restart(const NodeConfig &config);
    void detach();

    bool hasNode() const override;
    std::shared_ptr<IRpcClient> getClient() override;
    std::shared_ptr<IRequestHooks> getRequestHooks() override;

    /**
     * @brief Number of backing clients created so far (attach + restart)
     */
    size_t getGeneration() const;

private:
    ClientFactory factory_;
    std::shared_ptr<IRequestHooks> hooks_;
    std::shared_ptr<RestartTolerantClient> handle_;

    mutable std::mutex mutex_;
    size_t generation_ = 0;
};

}  // namespace JAIL
