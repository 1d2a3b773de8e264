#pragma once
#include <string>
#include <string_view>
#include <vector>
#define STOICH_ELEMENT_MAX 118

namespace stoich::core {

/// @cond DEV
struct ElementData {
  int atomic_number;
  const char *name;
  const char *symbol;
  double mass;
};

/// \internal
inline constexpr ElementData ELEMENTDATA_TABLE[STOICH_ELEMENT_MAX + 1] = {
    {0, "dummy", "Xx", 0.0},
    {1, "hydrogen", "H", 1.00794},
    {2, "helium", "He", 4.002602},
    {3, "lithium", "Li", 6.941},
    {4, "beryllium", "Be", 9.012182},
    {5, "boron", "B", 10.811},
    {6, "carbon", "C", 12.0107},
    {7, "nitrogen", "N", 14.0067},
    {8, "oxygen", "O", 15.9994},
    {9, "fluorine", "F", 18.998403},
    {10, "neon", "Ne", 20.1797},
    {11, "sodium", "Na", 22.98977},
    {12, "magnesium", "Mg", 24.305},
    {13, "aluminium", "Al", 26.981538},
    {14, "silicon", "Si", 28.0855},
    {15, "phosphorus", "P", 30.973761},
    {16, "sulfur", "S", 32.065},
    {17, "chlorine", "Cl", 35.453},
    {18, "argon", "Ar", 39.948},
    {19, "potassium", "K", 39.0983},
    {20, "calcium", "Ca", 40.078},
    {21, "scandium", "Sc", 44.95591},
    {22, "titanium", "Ti", 47.867},
    {23, "vanadium", "V", 50.9415},
    {24, "chromium", "Cr", 51.9961},
    {25, "manganese", "Mn", 54.938049},
    {26, "iron", "Fe", 55.845},
    {27, "cobalt", "Co", 58.9332},
    {28, "nickel", "Ni", 58.6934},
    {29, "copper", "Cu", 63.546},
    {30, "zinc", "Zn", 65.409},
    {31, "gallium", "Ga", 69.723},
    {32, "germanium", "Ge", 72.64},
    {33, "arsenic", "As", 74.9216},
    {34, "selenium", "Se", 78.96},
    {35, "bromine", "Br", 79.904},
    {36, "krypton", "Kr", 83.798},
    {37, "rubidium", "Rb", 85.4678},
    {38, "strontium", "Sr", 87.62},
    {39, "yttrium", "Y", 88.90585},
    {40, "zirconium", "Zr", 91.224},
    {41, "niobium", "Nb", 92.90638},
    {42, "molybdenum", "Mo", 95.94},
    {43, "technetium", "Tc", 98.0},
    {44, "ruthenium", "Ru", 101.07},
    {45, "rhodium", "Rh", 102.9055},
    {46, "palladium", "Pd", 106.42},
    {47, "silver", "Ag", 107.8682},
    {48, "cadmium", "Cd", 112.411},
    {49, "indium", "In", 114.818},
    {50, "tin", "Sn", 118.71},
    {51, "antimony", "Sb", 121.76},
    {52, "tellurium", "Te", 127.6},
    {53, "iodine", "I", 126.90447},
    {54, "xenon", "Xe", 131.293},
    {55, "caesium", "Cs", 132.90545},
    {56, "barium", "Ba", 137.327},
    {57, "lanthanum", "La", 138.9055},
    {58, "cerium", "Ce", 140.116},
    {59, "praseodymium", "Pr", 140.90765},
    {60, "neodymium", "Nd", 144.24},
    {61, "promethium", "Pm", 145.0},
    {62, "samarium", "Sm", 150.36},
    {63, "europium", "Eu", 151.964},
    {64, "gadolinium", "Gd", 157.25},
    {65, "terbium", "Tb", 158.92534},
    {66, "dysprosium", "Dy", 162.5},
    {67, "holmium", "Ho", 164.93032},
    {68, "erbium", "Er", 167.259},
    {69, "thulium", "Tm", 168.93421},
    {70, "ytterbium", "Yb", 173.04},
    {71, "lutetium", "Lu", 174.967},
    {72, "hafnium", "Hf", 178.49},
    {73, "tantalum", "Ta", 180.9479},
    {74, "tungsten", "W", 183.84},
    {75, "rhenium", "Re", 186.207},
    {76, "osmium", "Os", 190.23},
    {77, "iridium", "Ir", 192.217},
    {78, "platinum", "Pt", 195.078},
    {79, "gold", "Au", 196.96655},
    {80, "mercury", "Hg", 200.59},
    {81, "thallium", "Tl", 204.3833},
    {82, "lead", "Pb", 207.2},
    {83, "bismuth", "Bi", 208.98038},
    {84, "polonium", "Po", 209.0},
    {85, "astatine", "At", 210.0},
    {86, "radon", "Rn", 222.0},
    {87, "francium", "Fr", 223.0},
    {88, "radium", "Ra", 226.0},
    {89, "actinium", "Ac", 227.0},
    {90, "thorium", "Th", 232.0381},
    {91, "protactinium", "Pa", 231.03588},
    {92, "uranium", "U", 238.02891},
    {93, "neptunium", "Np", 237.0},
    {94, "plutonium", "Pu", 244.0},
    {95, "americium", "Am", 243.0},
    {96, "curium", "Cm", 247.0},
    {97, "berkelium", "Bk", 247.0},
    {98, "californium", "Cf", 251.0},
    {99, "einsteinium", "Es", 252.0},
    {100, "fermium", "Fm", 257.0},
    {101, "mendelevium", "Md", 258.0},
    {102, "nobelium", "No", 259.0},
    {103, "lawrencium", "Lr", 262.0},
    {104, "rutherfordium", "Rf", 267.0},
    {105, "dubnium", "Db", 268.0},
    {106, "seaborgium", "Sg", 269.0},
    {107, "bohrium", "Bh", 270.0},
    {108, "hassium", "Hs", 269.0},
    {109, "meitnerium", "Mt", 278.0},
    {110, "darmstadtium", "Ds", 281.0},
    {111, "roentgenium", "Rg", 282.0},
    {112, "copernicium", "Cn", 285.0},
    {113, "nihonium", "Nh", 286.0},
    {114, "flerovium", "Fl", 289.0},
    {115, "moscovium", "Mc", 290.0},
    {116, "livermorium", "Lv", 293.0},
    {117, "tennessine", "Ts", 294.0},
    {118, "oganesson", "Og", 294.0}};

/// @endcond

/**
 * Utility class representing a chemical element from the allow-list of
 * known symbols (H-Og).
 *
 * Unlike a free-form label, an Element can only be constructed from an
 * exact, case-sensitive symbol or a valid atomic number, so holding one
 * guarantees the symbol is a real element.
 */
class Element {
public:
  Element() = delete;

  /**
   * Construct an Element instance from its chemical symbol.
   *
   * \param symbol the exact (case-sensitive) chemical symbol e.g. `"Na"`.
   *
   * \throws stoich::core::BalanceError of kind UnknownElement if the symbol
   * is not in the element table.
   */
  explicit Element(std::string_view symbol);

  /**
   * Construct an Element instance from its atomic number.
   *
   * \param num the atomic number of the element, in range [1,118]
   *
   * \throws std::out_of_range for numbers outside that range.
   */
  explicit Element(int num);

  /// The Element symbol e.g. `"H", "He", "Li"`
  inline std::string symbol() const { return m_data->symbol; }

  /// The Element name e.g. `"hydrogen", "helium", "lithium"`
  inline std::string name() const { return m_data->name; }

  /// The average isotopic mass of this Element in atomic mass units.
  inline double mass() const { return m_data->mass; }

  /// The atomic number of this Element.
  inline int atomic_number() const { return m_data->atomic_number; }

  bool operator<(const Element &rhs) const {
    return atomic_number() < rhs.atomic_number();
  }

  bool operator==(const Element &rhs) const {
    return atomic_number() == rhs.atomic_number();
  }

  bool operator!=(const Element &rhs) const {
    return atomic_number() != rhs.atomic_number();
  }

private:
  const ElementData *m_data{nullptr};
};

/**
 * Check whether a string is a known element symbol.
 *
 * The comparison is exact: `"Co"` is cobalt while `"CO"` and `"co"` are
 * not element symbols.
 */
bool is_element_symbol(std::string_view symbol);

/// All elements of the table in order of atomic number.
std::vector<Element> all_elements();

} // namespace stoich::core
