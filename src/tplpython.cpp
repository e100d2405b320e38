/*
 * This inclusion should be put at the beginning.  It will include <Python.h>.
 */
#include <boost/python.hpp>
#include <boost/python/stl_iterator.hpp>
#include <iostream>
#include "tpltypes.h"
#include "tplsequence.h"
#include "tplcontacts.h"
#include "tplalign.h"

namespace python = boost::python;
using namespace TPL;

// Python sequences of (x, y, z) triples become points
static vector<CartesianPoint> toPoints(const python::object& coords) {
  vector<CartesianPoint> points;
  python::stl_input_iterator<python::object> it(coords), end;
  for (; it != end; ++it) {
    python::object p = *it;
    if (python::len(p) != 3) TplUtils::error("coordinate " + TplUtils::toString(points.size()) + " does not have 3 components", "templar.toPoints");
    points.push_back(CartesianPoint(python::extract<double>(p[0]), python::extract<double>(p[1]), python::extract<double>(p[2])));
  }
  return points;
}

static sparseContacts toContacts(const python::object& contacts) {
  sparseContacts pairs;
  python::stl_input_iterator<python::object> it(contacts), end;
  for (; it != end; ++it) {
    python::object c = *it;
    if (python::len(c) != 2) TplUtils::error("contact " + TplUtils::toString(pairs.size()) + " is not an index pair", "templar.toContacts");
    pairs.push_back(contactPair(python::extract<int>(c[0]), python::extract<int>(c[1])));
  }
  return pairs;
}

static python::list toList(const sparseContacts& contacts) {
  python::list l;
  for (int k = 0; k < contacts.size(); k++) l.append(python::make_tuple(contacts[k].first, contacts[k].second));
  return l;
}

static python::list contactMapToList(const ContactMap& cm) {
  python::list rows;
  for (int i = 0; i < cm.size(); i++) {
    python::list row;
    for (int j = 0; j < cm.size(); j++) row.append(cm(i, j) ? 1 : 0);
    rows.append(row);
  }
  return rows;
}

/*
 * This is a macro Boost.Python provides to signify a Python extension module.
 */
BOOST_PYTHON_MODULE(templar) {
    // An established convention for using boost.python.
    using namespace boost::python;

    class_<ContactMap>("ContactMap", init<int>())
    .def("size", &ContactMap::size)
    .def("__len__", &ContactMap::size)
    .def("get", &ContactMap::inContact)
    .def("isSymmetric", &ContactMap::isSymmetric)
    .def("numContacts", &ContactMap::numContacts)
    .def("toList", &contactMapToList)
    .def("toSparse", +[](const ContactMap& cm) { return toList(cm.toSparse()); })
    .def("__eq__", &ContactMap::operator==)
    ;

    def("contactMap", +[](const object& coords, double threshold, int maxLen) {
        return ContactMapBuilder(threshold, maxLen).buildDense(toPoints(coords));
    }, (python::arg("coords"), python::arg("threshold") = 6.0, python::arg("maxLen") = 1000));

    def("sparseContactMap", +[](const object& coords, double threshold, int maxLen) {
        return toList(ContactMapBuilder(threshold, maxLen).buildSparse(toPoints(coords)));
    }, (python::arg("coords"), python::arg("threshold") = 6.0, python::arg("maxLen") = 1000));

    def("pdbContactMap", +[](const string& pdbText, double threshold, int maxLen) {
        return ContactMapBuilder(threshold, maxLen).buildDenseFromPDBString(pdbText);
    }, (python::arg("pdb"), python::arg("threshold") = 6.0, python::arg("maxLen") = 1000));

    def("pdbSparseContactMap", +[](const string& pdbText, double threshold, int maxLen) {
        return toList(ContactMapBuilder(threshold, maxLen).buildSparseFromPDBString(pdbText));
    }, (python::arg("pdb"), python::arg("threshold") = 6.0, python::arg("maxLen") = 1000));

    def("projectContactMap", +[](const string& queryAln, const string& targetAln, const object& contacts, int radius) {
        return ContactMapProjector(radius).project(queryAln, targetAln, toContacts(contacts));
    }, (python::arg("queryAlignment"), python::arg("targetAlignment"), python::arg("contacts"), python::arg("radius") = 2));

    def("oneHot", +[](const string& seq) {
        vector<vector<int> > enc = SeqTools::oneHot(seq);
        python::list rows;
        for (int i = 0; i < enc.size(); i++) {
            python::list row;
            for (int j = 0; j < enc[i].size(); j++) row.append(enc[i][j]);
            rows.append(row);
        }
        return rows;
    });

    def("oneHotAlphabet", &SeqTools::oneHotAlphabet);
}
