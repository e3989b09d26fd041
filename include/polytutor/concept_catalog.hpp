#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "polytutor/common.hpp"
#include "polytutor/types.hpp"

namespace polytutor {

struct ConceptEntry {
  std::string name;
  std::vector<std::string> aliases;
  Complexity complexity{Complexity::kIntermediate};
  std::vector<std::string> prerequisites;
  std::vector<std::string> next_concepts;
  std::vector<std::string> keywords;
};

// Organic chemistry concepts the tutor recognizes by name.
inline const std::vector<ConceptEntry>& concept_catalog() {
  static const std::vector<ConceptEntry> kCatalog = {
      {"SN2", {"sn2", "bimolecular substitution", "backside attack"}, Complexity::kIntermediate,
       {"nucleophiles", "leaving groups", "stereochemistry"}, {"SN1", "E2"},
       {"substitution", "reaction", "process", "mechanism"}},
      {"SN1", {"sn1", "unimolecular substitution"}, Complexity::kIntermediate,
       {"carbocations", "leaving groups"}, {"E1", "SN2"}, {"substitution", "reaction", "process", "carbocation"}},
      {"E2", {" e2 ", "e2 reaction", "bimolecular elimination"}, Complexity::kIntermediate, {"SN2", "bases"}, {"E1"},
       {"elimination", "reaction", "process"}},
      {"E1", {" e1 ", "e1 reaction", "unimolecular elimination"}, Complexity::kIntermediate, {"carbocations"}, {"E2"},
       {"elimination", "reaction", "process"}},
      {"nucleophiles", {"nucleophile", "nucleophilic"}, Complexity::kBeginner, {"electronegativity"}, {"SN2"},
       {"electron", "relationship", "effect"}},
      {"carbocations", {"carbocation"}, Complexity::kIntermediate, {"hybridization"}, {"SN1", "E1"},
       {"structure", "intermediate"}},
      {"stereochemistry", {"stereochemistry", "stereoisomer", "enantiomer"}, Complexity::kIntermediate,
       {"chirality"}, {"SN2"}, {"structure", "molecule"}},
      {"chirality", {"chirality", "chiral"}, Complexity::kBeginner, {"molecular geometry"}, {"stereochemistry"},
       {"structure", "molecule"}},
      {"hybridization", {"hybridization", "sp3", "sp2", "orbital"}, Complexity::kBeginner, {"atomic orbitals"},
       {"molecular geometry", "carbocations"}, {"structure", "orbital"}},
      {"resonance", {"resonance", "delocalization"}, Complexity::kIntermediate, {"lewis structures"},
       {"aromaticity"}, {"structure", "electron"}},
      {"aromaticity", {"aromatic", "benzene", "huckel"}, Complexity::kAdvanced, {"resonance", "hybridization"},
       {"electrophilic aromatic substitution"}, {"structure", "molecule"}},
      {"functional groups", {"functional group"}, Complexity::kBeginner, {}, {"nomenclature"},
       {"system", "organization"}},
      {"acid-base reactions", {"acid-base", "acid base", "pka"}, Complexity::kBeginner, {"electronegativity"},
       {"nucleophiles"}, {"reaction", "cause", "effect"}},
      {"reaction networks", {"synthesis route", "retrosynthesis", "reaction network"}, Complexity::kAdvanced,
       {"functional groups", "SN2", "E2"}, {}, {"network", "system", "synthesis"}},
  };
  return kCatalog;
}

inline const ConceptEntry* find_concept(const std::string& name) {
  const std::string n = to_lower(trim(name));
  for (const auto& c : concept_catalog()) {
    if (to_lower(c.name) == n) {
      return &c;
    }
  }
  return nullptr;
}

// Catalog concepts mentioned in free text, in catalog order.
inline std::vector<std::string> concepts_in_text(const std::string& text) {
  std::string lower = " " + to_lower(text) + " ";
  for (char& c : lower) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
      c = ' ';
    }
  }
  std::vector<std::string> out;
  for (const auto& c : concept_catalog()) {
    if (contains_any(lower, c.aliases) && std::find(out.begin(), out.end(), c.name) == out.end()) {
      out.push_back(c.name);
    }
  }
  return out;
}

}  // namespace polytutor
