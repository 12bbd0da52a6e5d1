#pragma once

#include "errors.hpp"
#include "node.hpp"
#include "radio.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace wsnsim
{
    // Node id -> node. Owns the nodes; iteration follows insertion order.
    class Network final : public IRadioDirectory
    {
    public:
        Node &add_node(std::unique_ptr<Node> node)
        {
            if (!node)
            {
                throw std::invalid_argument("Network::add_node: null");
            }
            const NodeId id = node->id();
            if (m_byId.count(id) != 0)
            {
                throw DuplicateNodeError("node_id " + std::to_string(id) + " already in use");
            }
            Node &ref = *node;
            m_byId.emplace(id, node.get());
            m_nodes.push_back(std::move(node));
            return ref;
        }

        void remove_node(NodeId id)
        {
            auto it = m_byId.find(id);
            if (it == m_byId.end())
            {
                throw NotFoundError("Node " + std::to_string(id) + " not found in network.");
            }
            // A started node has an endpoint and pending continuations bound to it.
            if (it->second->started())
            {
                throw std::logic_error("Network::remove_node: node " + std::to_string(id) + " already started");
            }
            const Node *ptr = it->second;
            m_byId.erase(it);
            m_nodes.erase(std::remove_if(m_nodes.begin(), m_nodes.end(),
                                         [ptr](const std::unique_ptr<Node> &n)
                                         { return n.get() == ptr; }),
                          m_nodes.end());
        }

        Node &get_node(NodeId id) const
        {
            auto it = m_byId.find(id);
            if (it == m_byId.end())
            {
                throw NotFoundError("node_id " + std::to_string(id) + " not found in the network");
            }
            return *it->second;
        }

        bool contains(NodeId id) const { return m_byId.count(id) != 0; }

        std::size_t size() const noexcept { return m_nodes.size(); }

        const std::vector<std::unique_ptr<Node>> &nodes() const noexcept { return m_nodes; }

        void start_all()
        {
            for (auto &n : m_nodes)
            {
                n->start();
            }
        }

        // IRadioDirectory
        const RadioProfile &radio_of(NodeId id) const override
        {
            return get_node(id).radio();
        }

    private:
        std::vector<std::unique_ptr<Node>> m_nodes;
        std::unordered_map<NodeId, Node *> m_byId;
    };
}
