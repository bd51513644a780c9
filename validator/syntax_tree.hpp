#ifndef VALIDATOR_SYNTAX_TREE_HPP
#define VALIDATOR_SYNTAX_TREE_HPP

#include <string>
#include <vector>

#include "proto/execution.pb.h"

namespace validator {

enum class NodeKind { IMPORT, CALL, NEW, ATTRIBUTE, NAME, LOOP };

struct SyntaxNode {
  NodeKind kind = NodeKind::NAME;
  // Module names for imports, dotted callees (with import aliases resolved)
  // for calls and constructions, member names for attributes.
  std::string name;
  int line = 0;
  int column = 0;
  // Only meaningful for loops.
  bool infinite = false;
  bool exits = false;
};

// The constructs of a snippet that security rules are checked against, in
// source order.
struct SyntaxTree {
  std::vector<SyntaxNode> nodes;
  bool well_formed = true;
  std::string error;
  int error_line = 0;
};

// Parses code written in the given language. Malformed code still yields the
// nodes found before and around the error.
SyntaxTree Parse(const std::string& code, proto::Language language);

}  // namespace validator

#endif
