#include "tplalign.h"
using namespace TPL;

/* ------------ alignedIndex ------------ */

alignedIndex alignedIndex::mappedTo(int i) {
  if (i < 0) TplUtils::error("cannot map to negative index " + TplUtils::toString(i), "alignedIndex::mappedTo");
  alignedIndex ai;
  ai.mapped = true;
  ai.idx = i;
  return ai;
}

int alignedIndex::index() const {
  if (!mapped) TplUtils::error("index requested of an unmapped position", "alignedIndex::index");
  return idx;
}

/* ------------ IndexCorrespondence ------------ */

alignedIndex IndexCorrespondence::lookup(int a) const {
  if (!inDomain(a)) return alignedIndex::unmapped();
  return table[a];
}

int IndexCorrespondence::numMapped() const {
  int n = 0;
  for (int i = 0; i < table.size(); i++) {
    if (table[i].isMapped()) n++;
  }
  return n;
}

/* ------------ AlignmentIndexMapper ------------ */

IndexCorrespondence AlignmentIndexMapper::correspondence(const string& queryAln, const string& targetAln) {
  if (queryAln.size() != targetAln.size()) {
    throw AlignmentLengthMismatchError(TplUtils::errorMessage("query alignment has " + TplUtils::toString(queryAln.size()) + " columns, target alignment has " + TplUtils::toString(targetAln.size()), "AlignmentIndexMapper::correspondence"));
  }
  IndexCorrespondence corr;
  int qi = 0;
  for (int c = 0; c < queryAln.size(); c++) {
    bool qGap = SeqTools::isGap(queryAln[c]);
    bool tGap = SeqTools::isGap(targetAln[c]);
    if (qGap) {
      if (!tGap) corr.table.push_back(alignedIndex::unmapped());
    } else if (tGap) {
      corr.uncovered.push_back(qi);
      qi++;
    } else {
      corr.table.push_back(alignedIndex::mappedTo(qi));
      qi++;
    }
  }
  corr.queryLen = qi;
  return corr;
}

IndexCorrespondence AlignmentIndexMapper::correspondence(const Sequence& queryAln, const Sequence& targetAln) {
  return AlignmentIndexMapper::correspondence(queryAln.toString(), targetAln.toString());
}

/* ------------ ContactMapProjector ------------ */

ContactMapProjector::ContactMapProjector(int _genRadius) {
  if (_genRadius < 0) throw ConfigurationError(TplUtils::errorMessage("generated-contact radius cannot be negative, got " + TplUtils::toString(_genRadius), "ContactMapProjector::ContactMapProjector"));
  genRadius = _genRadius;
}

ContactMapProjector::ContactMapProjector(const projectionParams& params) {
  params.validate();
  genRadius = params.getGeneratedRadius();
}

sparseContacts ContactMapProjector::generatedContacts(const IndexCorrespondence& corr, int radius) {
  sparseContacts gen;
  const vector<int>& uncovered = corr.uncoveredQueryPositions();
  for (int k = 0; k < uncovered.size(); k++) {
    int q = uncovered[k];
    for (int j = 1; j <= radius; j++) {
      gen.push_back(contactPair(q + j, q));
      gen.push_back(contactPair(q - j, q));
    }
  }
  return gen;
}

sparseContacts ContactMapProjector::translatedContacts(const IndexCorrespondence& corr, const sparseContacts& targetContacts) {
  sparseContacts trans;
  for (int k = 0; k < targetContacts.size(); k++) {
    alignedIndex a = corr.lookup(targetContacts[k].first);
    alignedIndex b = corr.lookup(targetContacts[k].second);
    if (!a.isMapped() || !b.isMapped()) continue;
    trans.push_back(contactPair(a.index(), b.index()));
  }
  return trans;
}

sparseContacts ContactMapProjector::shiftContacts(const sparseContacts& contacts, int offset) {
  if (offset < 0) TplUtils::error("negative alignment offset " + TplUtils::toString(offset), "ContactMapProjector::shiftContacts");
  if (offset == 0) return contacts;
  sparseContacts shifted;
  for (int k = 0; k < contacts.size(); k++) {
    int a = contacts[k].first - offset, b = contacts[k].second - offset;
    if ((a < 0) || (b < 0)) continue;
    shifted.push_back(contactPair(a, b));
  }
  return shifted;
}

sparseContacts ContactMapProjector::projectedPairs(const IndexCorrespondence& corr, const sparseContacts& targetContacts) const {
  sparseContacts pairs = generatedContacts(corr, genRadius);
  sparseContacts trans = translatedContacts(corr, targetContacts);
  pairs.insert(pairs.end(), trans.begin(), trans.end());
  return pairs;
}

ContactMap ContactMapProjector::assemble(int Nq, const sparseContacts& pairs) const {
  ContactMap cm(Nq);
  for (int i = 0; i < Nq; i++) cm.set(i, i);
  for (int k = 0; k < pairs.size(); k++) {
    int i = pairs[k].first, j = pairs[k].second;
    // generated offsets run past the query ends near the termini
    if ((i < 0) || (i >= Nq)) continue;
    cm.setSymmetric(i, j);
  }
  return cm;
}

ContactMap ContactMapProjector::project(const IndexCorrespondence& corr, const sparseContacts& targetContacts) const {
  return assemble(corr.queryLength(), projectedPairs(corr, targetContacts));
}

ContactMap ContactMapProjector::project(const string& queryAln, const string& targetAln, const sparseContacts& targetContacts) const {
  return project(AlignmentIndexMapper::correspondence(queryAln, targetAln), targetContacts);
}

ContactMap ContactMapProjector::project(const Sequence& queryAln, const Sequence& targetAln, const sparseContacts& targetContacts) const {
  return project(AlignmentIndexMapper::correspondence(queryAln, targetAln), targetContacts);
}
