//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_ENTITYGROUPGRAPH_HPP
#define FIELDREL_ENTITYGROUPGRAPH_HPP

#include <map>
#include <vector>

#include <boost/graph/adjacency_list.hpp>

#include "CandidateField.hpp"
#include "RelationshipSnapshot.hpp"

#include "utils/log.hpp"

namespace fieldrel {
    /**
     * @brief undirected graph of fields linked by discovered relationships.
     *
     * @details each connected component is one entity group, i.e. a set of fields that name the same thing:
     * <pre>
     *   item.name -- drop.item_name
     *   item.name -- quest.reward_item_name
     *
     *   => { drop::item_name, item::name, quest::reward_item_name }
     * </pre>
     */
    class EntityGroupGraph {
    public:
        using Graph =
            boost::adjacency_list<boost::setS, boost::vecS, boost::undirectedS, FieldRef>;
        
        EntityGroupGraph();
        
        bool addField(const FieldRef &field);
        bool addRelationship(const FieldRef &lhs, const FieldRef &rhs);
        bool addRelationship(const RelationshipSnapshot &snapshot);
        
        [[nodiscard]]
        bool isLinked(const FieldRef &lhs, const FieldRef &rhs) const;
        
        size_t fieldCount() const;
        
        /**
         * @return connected components with at least two members. members are sorted, groups are sorted by their first member.
         */
        std::vector<std::vector<FieldRef>> groups() const;
        
    private:
        LoggerPtr _logger;
        
        Graph _graph;
        std::map<FieldRef, Graph::vertex_descriptor> _nodeMap;
    };
}

#endif //FIELDREL_ENTITYGROUPGRAPH_HPP
