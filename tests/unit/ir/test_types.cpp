#include <gtest/gtest.h>

#include "typeflow/ir/program.hpp"
#include "typeflow/ir/type.hpp"
#include "typeflow/ir/type_utils.hpp"

using namespace typeflow;

// ============================================================================
// Interning and Rendering
// ============================================================================

TEST(IrTypes, CompositeTypesAreInterned)
{
  TypeContext types;
  const Type * i = types.int_type();

  EXPECT_EQ(types.get_pointer(i), types.get_pointer(i));
  EXPECT_EQ(types.get_slice(i), types.get_slice(i));
  EXPECT_EQ(types.get_map(types.string_type(), i), types.get_map(types.string_type(), i));
  EXPECT_EQ(types.get_signature({i}, {i}), types.get_signature({i}, {i}));
  EXPECT_NE(types.get_signature({i}, {i}), types.get_signature({i}, {i}, true));
  EXPECT_NE(types.get_chan(i), types.get_chan(i, ChanDir::RecvOnly));
}

TEST(IrTypes, NamedTypesAreFresh)
{
  TypeContext types;
  const Type * a = types.new_named("P", "T", types.int_type());
  const Type * b = types.new_named("P", "T", types.int_type());
  EXPECT_NE(a, b);
  EXPECT_EQ(a->underlying(), types.int_type());
}

TEST(IrTypes, InterfaceMethodOrderDoesNotMatter)
{
  TypeContext types;
  const Type * sig = types.get_signature({}, {});
  const Type * ab = types.get_interface({{"a", sig}, {"b", sig}});
  const Type * ba = types.get_interface({{"b", sig}, {"a", sig}});
  EXPECT_EQ(ab, ba);
}

TEST(IrTypes, Rendering)
{
  TypeContext types;
  const Type * i = types.int_type();
  const Type * named = types.new_named("P", "C", i);

  EXPECT_EQ(types.get_pointer(named)->to_string(), "*P.C");
  EXPECT_EQ(types.get_slice(i)->to_string(), "[]int");
  EXPECT_EQ(types.get_array(i, 4)->to_string(), "[4]int");
  EXPECT_EQ(types.get_map(types.string_type(), named)->to_string(), "map[string]P.C");
  EXPECT_EQ(types.get_chan(i, ChanDir::RecvOnly)->to_string(), "<-chan int");
  EXPECT_EQ(
    types.get_signature({i}, {types.bool_type(), i})->to_string(), "func(int) (bool, int)");
  EXPECT_EQ(types.get_signature({types.get_slice(i)}, {}, true)->to_string(), "func(...int)");
  EXPECT_EQ(types.empty_interface()->to_string(), "interface{}");
  EXPECT_EQ(types.byte_type()->to_string(), "uint8");
  EXPECT_EQ(types.lookup_basic("byte"), types.byte_type());
}

// ============================================================================
// Type Queries
// ============================================================================

TEST(IrTypeUtils, PointerNesting)
{
  TypeContext types;
  const Type * sig = types.get_signature({}, {});
  const Type * iface = types.new_named("P", "I", types.get_interface({{"m", sig}}));

  const Type * p1 = types.get_pointer(iface);
  const Type * p2 = types.get_pointer(p1);
  EXPECT_EQ(interface_under_ptr(p1), iface);
  EXPECT_EQ(interface_under_ptr(p2), iface);
  EXPECT_EQ(interface_under_ptr(iface), nullptr);
  EXPECT_EQ(interface_under_ptr(types.get_pointer(types.int_type())), nullptr);

  EXPECT_EQ(function_under_ptr(types.get_pointer(types.get_pointer(sig))), sig);
  EXPECT_TRUE(is_function(sig));
  EXPECT_TRUE(is_interface(iface));
}

TEST(IrTypeUtils, ElementTypes)
{
  TypeContext types;
  const Type * i = types.int_type();

  EXPECT_EQ(slice_array_elem(types.get_slice(i), types), i);
  EXPECT_EQ(slice_array_elem(types.get_array(i, 2), types), i);
  EXPECT_EQ(slice_array_elem(types.get_pointer(types.get_array(i, 2)), types), i);
  EXPECT_EQ(slice_array_elem(types.string_type(), types), types.byte_type());
  EXPECT_EQ(slice_array_elem(i, types), nullptr);

  EXPECT_EQ(chan_elem(types.get_chan(i)), i);
  EXPECT_EQ(chan_elem(i), nullptr);
  EXPECT_NE(map_of(types.get_map(i, i)), nullptr);
  EXPECT_EQ(map_of(types.get_slice(i)), nullptr);

  const Type * s = types.get_struct({{"x", i, false}, {"y", types.bool_type(), false}});
  ASSERT_NE(struct_field(s, 1), nullptr);
  EXPECT_EQ(struct_field(s, 1)->name, "y");
  EXPECT_EQ(struct_field(s, 2), nullptr);
}

TEST(IrTypeUtils, MethodSets)
{
  Program prog;
  TypeContext & types = prog.types();
  Package * pkg = prog.create_package("P");
  const Type * sig = types.get_signature({}, {});

  Type * t = types.new_named("P", "T", types.get_struct({}));
  Function * value_m = prog.create_method(pkg, t, "v", sig, false);
  Function * ptr_m = prog.create_method(pkg, t, "p", sig, true);
  const Type * ptr_t = types.get_pointer(t);

  EXPECT_EQ(lookup_method(t, "v"), value_m);
  EXPECT_EQ(lookup_method(t, "p"), nullptr);
  EXPECT_EQ(lookup_method(ptr_t, "v"), value_m);
  EXPECT_EQ(lookup_method(ptr_t, "p"), ptr_m);
  EXPECT_EQ(lookup_method(t, "missing"), nullptr);

  const Type * needs_p = types.get_interface({{"p", sig}});
  const Type * needs_v = types.get_interface({{"v", sig}});
  EXPECT_FALSE(implements(t, needs_p));
  EXPECT_TRUE(implements(ptr_t, needs_p));
  EXPECT_TRUE(implements(t, needs_v));
  EXPECT_TRUE(implements(types.int_type(), types.empty_interface()));
}

TEST(IrTypeUtils, ImplementsChecksSignatures)
{
  Program prog;
  TypeContext & types = prog.types();
  Package * pkg = prog.create_package("P");

  Type * t = types.new_named("P", "T", types.int_type());
  prog.create_method(pkg, t, "m", types.get_signature({types.int_type()}, {}), false);

  EXPECT_FALSE(implements(t, types.get_interface({{"m", types.get_signature({}, {})}})));
  EXPECT_TRUE(
    implements(t, types.get_interface({{"m", types.get_signature({types.int_type()}, {})}})));
}

TEST(IrTypeUtils, InterfaceInclusionAndTypeParams)
{
  TypeContext types;
  const Type * sig = types.get_signature({}, {});
  const Type * small = types.get_interface({{"a", sig}});
  const Type * big = types.get_interface({{"a", sig}, {"b", sig}});

  EXPECT_TRUE(implements(big, small));
  EXPECT_FALSE(implements(small, big));

  const Type * x = types.new_type_param("X", small);
  EXPECT_TRUE(is_interface(x));
  EXPECT_TRUE(implements(big, x));
}
