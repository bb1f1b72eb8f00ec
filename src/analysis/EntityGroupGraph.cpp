//
// Created by fieldrel on 10/17/26.
//

#include <algorithm>

#include <boost/graph/connected_components.hpp>

#include "EntityGroupGraph.hpp"

namespace fieldrel {
    EntityGroupGraph::EntityGroupGraph():
        _logger(createLogger("EntityGroupGraph"))
    {
    
    }
    
    bool EntityGroupGraph::addField(const FieldRef &field) {
        if (_nodeMap.find(field) != _nodeMap.end()) {
            return false;
        }
        
        auto nodeIdx = add_vertex(field, _graph);
        _nodeMap.insert({ field, nodeIdx });
        
        return true;
    }
    
    bool EntityGroupGraph::addRelationship(const FieldRef &lhs, const FieldRef &rhs) {
        if (lhs == rhs) {
            return false;
        }
        
        addField(lhs);
        addField(rhs);
        
        if (isLinked(lhs, rhs)) {
            return false;
        }
        
        _logger->trace("linking {} <=> {}", lhs.toString(), rhs.toString());
        add_edge(_nodeMap.at(lhs), _nodeMap.at(rhs), _graph);
        
        return true;
    }
    
    bool EntityGroupGraph::addRelationship(const RelationshipSnapshot &snapshot) {
        return addRelationship(snapshot.sourceRef(), snapshot.targetRef());
    }
    
    bool EntityGroupGraph::isLinked(const FieldRef &lhs, const FieldRef &rhs) const {
        auto lhsIt = _nodeMap.find(lhs);
        auto rhsIt = _nodeMap.find(rhs);
        if (lhsIt == _nodeMap.end() || rhsIt == _nodeMap.end()) {
            return false;
        }
        
        return boost::edge(lhsIt->second, rhsIt->second, _graph).second;
    }
    
    size_t EntityGroupGraph::fieldCount() const {
        return boost::num_vertices(_graph);
    }
    
    std::vector<std::vector<FieldRef>> EntityGroupGraph::groups() const {
        std::vector<std::vector<FieldRef>> result;
        
        const auto vertexCount = boost::num_vertices(_graph);
        if (vertexCount == 0) {
            return result;
        }
        
        std::vector<int> component(vertexCount);
        int componentCount = boost::connected_components(_graph, &component[0]);
        
        std::vector<std::vector<FieldRef>> components(componentCount);
        
        boost::graph_traits<Graph>::vertex_iterator vi, viEnd;
        for (boost::tie(vi, viEnd) = boost::vertices(_graph); vi != viEnd; ++vi) {
            components[component[*vi]].push_back(_graph[*vi]);
        }
        
        for (auto &members: components) {
            if (members.size() < 2) {
                continue;
            }
            
            std::sort(members.begin(), members.end());
            result.push_back(std::move(members));
        }
        
        std::sort(result.begin(), result.end(), [](const auto &lhs, const auto &rhs) {
            return lhs.front() < rhs.front();
        });
        
        return result;
    }
}
