#include "node_numbering.hpp"
#include "ast_walkers.hpp"
#include <functional>

void number_program_nodes(Program* root) {
    NodeId next_id = 1;
    std::function<void(SyntaxNode)> number_node;
    number_node = [&](SyntaxNode node) {
        std::visit([&](const auto& n) { n->id = next_id++; }, node);
        syntax_node_children_walker(node, number_node);
    };
    for(std::shared_ptr<Item> item: root->items) {
        number_node(item);
    }
}
