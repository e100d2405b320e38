#ifndef _TPLALIGN_H
#define _TPLALIGN_H

#include "tpltypes.h"
#include "tplsequence.h"
#include "tplcontacts.h"

namespace TPL {

/* Where a target residue lands in the query: either on a query residue index
 * or nowhere (aligned against a query gap). */
class alignedIndex {
  public:
    static alignedIndex unmapped() { return alignedIndex(); }
    static alignedIndex mappedTo(int i);

    bool isMapped() const { return mapped; }
    int index() const; // error if unmapped

    bool operator==(const alignedIndex& other) const { return (mapped == other.mapped) && (!mapped || (idx == other.idx)); }
    bool operator!=(const alignedIndex& other) const { return !(*this == other); }
    friend ostream & operator<<(ostream &_os, const alignedIndex& _ai) {
      if (_ai.mapped) _os << _ai.idx;
      else _os << "unmapped";
      return _os;
    }

  private:
    alignedIndex() { mapped = false; idx = 0; }
    bool mapped;
    int idx;
};

/* Target-to-query residue index correspondence produced by one scan over a
 * gapped alignment. The domain is every target residue the scan visited,
 * i.e. target indices 0 through domainSize() - 1. */
class IndexCorrespondence {
  friend class AlignmentIndexMapper;

  public:
    IndexCorrespondence() { queryLen = 0; }

    int domainSize() const { return table.size(); }
    int queryLength() const { return queryLen; }
    bool inDomain(int a) const { return (a >= 0) && (a < table.size()); }

    // unmapped for indices outside the domain
    alignedIndex lookup(int a) const;
    alignedIndex operator[](int a) const { return lookup(a); }
    int numMapped() const;

    // query residues aligned against a target gap, in increasing order
    const vector<int>& uncoveredQueryPositions() const { return uncovered; }

  private:
    vector<alignedIndex> table;
    vector<int> uncovered;
    int queryLen;
};

class AlignmentIndexMapper {
  public:
    /* Scans the two gapped strings column by column. Throws
     * AlignmentLengthMismatchError if they differ in length. A column gapped
     * in both strings advances neither index. */
    static IndexCorrespondence correspondence(const string& queryAln, const string& targetAln);
    static IndexCorrespondence correspondence(const Sequence& queryAln, const Sequence& targetAln);
};

/* Carries a target contact graph over to the query through a gapped pairwise
 * alignment. Target contacts whose ends both map onto query residues are
 * translated; query residues with no template residue get generated contacts
 * to their neighbors within the generated-contact radius. The result is
 * symmetric, has every diagonal cell set, and has one row per query residue. */
class ContactMapProjector {
  public:
    ContactMapProjector(int _genRadius = 2);
    ContactMapProjector(const projectionParams& params);

    ContactMap project(const string& queryAln, const string& targetAln, const sparseContacts& targetContacts) const;
    ContactMap project(const Sequence& queryAln, const Sequence& targetAln, const sparseContacts& targetContacts) const;
    ContactMap project(const IndexCorrespondence& corr, const sparseContacts& targetContacts) const;

    /* The merged pair list before assembly: generated contacts followed by
     * translated ones. Generated pairs may point outside the query near its
     * ends; assembly drops those. */
    sparseContacts projectedPairs(const IndexCorrespondence& corr, const sparseContacts& targetContacts) const;

    static sparseContacts generatedContacts(const IndexCorrespondence& corr, int radius);
    static sparseContacts translatedContacts(const IndexCorrespondence& corr, const sparseContacts& targetContacts);

    /* Moves contacts into the index space of an alignment that starts at
     * residue offset: every index drops by offset, and pairs with an end
     * before the start are removed. */
    static sparseContacts shiftContacts(const sparseContacts& contacts, int offset);

    int getGeneratedRadius() const { return genRadius; }

  protected:
    ContactMap assemble(int Nq, const sparseContacts& pairs) const;

  private:
    int genRadius;
};

}

#endif
