#include "python/Parser.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace pystyle::python;

class ParserTest : public ::testing::Test {
protected:
  Module parse(const std::string& code) {
    Module module;
    SyntaxError error;
    EXPECT_TRUE(parseSource(code, module, &error))
        << error.line << ":" << error.column << ": " << error.message;
    return module;
  }

  SyntaxError parseError(const std::string& code) {
    Module module;
    SyntaxError error;
    EXPECT_FALSE(parseSource(code, module, &error));
    return error;
  }

  template <typename T>
  static const T& as(const NodePtr& node) {
    return std::get<T>(node->data);
  }
};

TEST_F(ParserTest, FunctionParameters) {
  auto module = parse("def f(a, /, b, c=1, *args, d, e=[], **kw) -> int:\n    pass\n");
  ASSERT_EQ(module.body.size(), 1u);
  EXPECT_EQ(module.body[0]->line, 1u);
  const auto& fn = as<FunctionDef>(module.body[0]);
  EXPECT_EQ(fn.name, "f");
  EXPECT_FALSE(fn.isAsync);
  EXPECT_EQ(fn.posOnlyArgs, std::vector<std::string>({"a"}));
  EXPECT_EQ(fn.args, std::vector<std::string>({"b", "c"}));
  EXPECT_EQ(fn.kwOnlyArgs, std::vector<std::string>({"d", "e"}));
  EXPECT_EQ(fn.varArg, "args");
  EXPECT_EQ(fn.kwArg, "kw");
  // keyword-only defaults are not positional defaults
  ASSERT_EQ(fn.defaults.size(), 1u);
  EXPECT_EQ(fn.defaults[0].kind, ExprKind::Constant);
  ASSERT_EQ(fn.body.size(), 1u);
}

TEST_F(ParserTest, DefaultKinds) {
  auto module = parse("def f(a=[], b={}, c={1}, d=(), e=None, f=-1, g=(2), h='s' 's',"
                      " i=f'{x}', j=..., k=list(), l=x.y):\n    pass\n");
  const auto& fn = as<FunctionDef>(module.body[0]);
  std::vector<ExprKind> expected = {
    ExprKind::List, ExprKind::Dict, ExprKind::Set, ExprKind::Tuple,
    ExprKind::Constant, ExprKind::Other, ExprKind::Constant, ExprKind::Constant,
    ExprKind::Other, ExprKind::Constant, ExprKind::Call, ExprKind::Attribute,
  };
  ASSERT_EQ(fn.defaults.size(), expected.size());
  for (size_t i = 0; i < expected.size(); ++i)
    EXPECT_EQ(fn.defaults[i].kind, expected[i]) << "default " << i;
}

TEST_F(ParserTest, DecoratedAndAsyncFunctions) {
  auto module = parse("@decorator\n@other(1)\ndef f():\n    pass\n\nasync def g():\n    await h()\n");
  ASSERT_EQ(module.body.size(), 2u);
  EXPECT_EQ(module.body[0]->line, 3u);
  EXPECT_TRUE(as<FunctionDef>(module.body[1]).isAsync);
  EXPECT_EQ(module.body[1]->line, 6u);
}

TEST_F(ParserTest, AssignmentTargets) {
  auto module = parse("a = B = 1\nx.y = 2\nz[0] = 3\n(p) = 4\nq, r = 5, 6\n");
  ASSERT_EQ(module.body.size(), 5u);

  const auto& chained = as<Assign>(module.body[0]);
  ASSERT_EQ(chained.targets.size(), 2u);
  EXPECT_EQ(chained.targets[0].id, "a");
  EXPECT_EQ(chained.targets[1].id, "B");
  EXPECT_EQ(chained.value.kind, ExprKind::Constant);

  EXPECT_EQ(as<Assign>(module.body[1]).targets[0].kind, ExprKind::Attribute);
  EXPECT_EQ(as<Assign>(module.body[2]).targets[0].kind, ExprKind::Subscript);
  EXPECT_EQ(as<Assign>(module.body[3]).targets[0].kind, ExprKind::Name);
  EXPECT_EQ(as<Assign>(module.body[3]).targets[0].id, "p");
  EXPECT_EQ(as<Assign>(module.body[4]).targets[0].kind, ExprKind::Tuple);
  EXPECT_EQ(module.body[4]->line, 5u);
}

TEST_F(ParserTest, AugmentedAndAnnotatedAssignmentsAreNotAssign) {
  auto module = parse("x += 1\ny: int = 2\nz: str\n");
  ASSERT_EQ(module.body.size(), 3u);
  EXPECT_EQ(as<OtherStmt>(module.body[0]).kind, "AugAssign");
  EXPECT_EQ(as<OtherStmt>(module.body[1]).kind, "AnnAssign");
  EXPECT_EQ(as<OtherStmt>(module.body[2]).kind, "AnnAssign");
}

TEST_F(ParserTest, ElifIsNestedIf) {
  auto module = parse("if a:\n    x = 1\nelif b:\n    y = 2\nelse:\n    z = 3\n");
  ASSERT_EQ(module.body.size(), 1u);
  const auto& outer = as<OtherStmt>(module.body[0]);
  EXPECT_EQ(outer.kind, "If");
  ASSERT_EQ(outer.children.size(), 2u);
  EXPECT_EQ(outer.children[1]->line, 3u);
  const auto& inner = as<OtherStmt>(outer.children[1]);
  EXPECT_EQ(inner.kind, "If");
  ASSERT_EQ(inner.children.size(), 2u);
  EXPECT_EQ(inner.children[1]->line, 6u);
}

TEST_F(ParserTest, TryHandlersAreIntermediateNodes) {
  auto module = parse("try:\n    a = 1\nexcept (KeyError, ValueError) as e:\n    b = 2\n"
                      "except Exception:\n    pass\nelse:\n    c = 3\nfinally:\n    d = 4\n");
  const auto& stmt = as<OtherStmt>(module.body[0]);
  EXPECT_EQ(stmt.kind, "Try");
  ASSERT_EQ(stmt.children.size(), 5u);
  EXPECT_EQ(as<OtherStmt>(stmt.children[1]).kind, "ExceptHandler");
  EXPECT_EQ(as<OtherStmt>(stmt.children[2]).kind, "ExceptHandler");
  EXPECT_EQ(stmt.children[3]->line, 8u);
  EXPECT_EQ(stmt.children[4]->line, 10u);
}

TEST_F(ParserTest, MatchStatement) {
  auto module = parse("match command.split():\n    case [action, obj]:\n        pass\n"
                      "    case {'k': v} if v > 1:\n        y = 2\n    case _:\n        pass\n");
  const auto& stmt = as<OtherStmt>(module.body[0]);
  EXPECT_EQ(stmt.kind, "Match");
  ASSERT_EQ(stmt.children.size(), 3u);
  EXPECT_EQ(as<OtherStmt>(stmt.children[1]).kind, "MatchCase");
  EXPECT_EQ(stmt.children[1]->line, 4u);
}

TEST_F(ParserTest, SoftKeywordsAsNames) {
  auto module = parse("match = re.match(p, s)\nmatch.group(0)\ntype = 1\ncase = 2\n");
  ASSERT_EQ(module.body.size(), 4u);
  EXPECT_EQ(as<Assign>(module.body[0]).targets[0].id, "match");
  EXPECT_EQ(as<OtherStmt>(module.body[1]).kind, "Expr");
}

TEST_F(ParserTest, ClassBody) {
  auto module = parse("class A(Base, metaclass=Meta):\n    attr = 1\n\n    def m(self):\n        pass\n");
  const auto& cls = as<ClassDef>(module.body[0]);
  EXPECT_EQ(cls.name, "A");
  ASSERT_EQ(cls.body.size(), 2u);
  EXPECT_EQ(cls.body[1]->line, 4u);
}

TEST_F(ParserTest, SemicolonSeparatedStatements) {
  auto module = parse("a = 1; b = 2;\nif x: y = 1; z = 2\n");
  ASSERT_EQ(module.body.size(), 3u);
  EXPECT_EQ(as<OtherStmt>(module.body[2]).children.size(), 2u);
}

TEST_F(ParserTest, RealisticModule) {
  parse(
    "\"\"\"Module docstring.\"\"\"\n"
    "import os, sys as system\n"
    "from . import sibling\n"
    "from collections import (OrderedDict,\n"
    "                         defaultdict,)\n"
    "\n"
    "CONSTANT: int = 10\n"
    "\n"
    "\n"
    "class Config(object):\n"
    "    __slots__ = ('a', 'b')\n"
    "\n"
    "    @property\n"
    "    def value(self) -> dict[str, list[int]]:\n"
    "        return {k: [i ** 2 for i in range(v) if i % 2] for k, v in self.items()}\n"
    "\n"
    "\n"
    "async def fetch(url, *, retries=3, **kwargs):\n"
    "    global counter\n"
    "    async with session.get(url) as resp, lock:\n"
    "        data = await resp.json()\n"
    "    async for chunk in stream:\n"
    "        yield chunk\n"
    "    while (n := len(data)) > 10:\n"
    "        data = data[1:n:2]\n"
    "    else:\n"
    "        pass\n"
    "    with (open('a') as f,\n"
    "          open('b') as g):\n"
    "        first, *rest = f.read().split()\n"
    "    assert rest, f\"empty {url!r:>10}\"\n"
    "    del rest[0], first\n"
    "    raise ValueError('bad') from None\n"
    "\n"
    "\n"
    "def gen():\n"
    "    x = yield\n"
    "    y = yield from other()\n"
    "    z = lambda a, b=2, *c, **d: (a, b, c, d)\n"
    "    w = [*x, *y] if x else {**z}\n"
    "    for i, (j, k) in enumerate(pairs):\n"
    "        continue\n"
    "    return not x and y or z is not None and w not in z\n"
    "\n"
    "print(*args, sep='', end=\"\\n\", **{'file': sys.stderr})\n"
    "value = obj.attr[1:-1, ::2](key=lambda item: -item)\n"
    "type Alias = list[int]\n"
    "result = (x for x in range(10))\n"
    "try:\n"
    "    pass\n"
    "except* OSError:\n"
    "    pass\n");
}

// Errors
TEST_F(ParserTest, ErrorsCarryPositions) {
  auto error = parseError("x = 1\ny = (1 +\n");
  EXPECT_EQ(error.message, "'(' was never closed");
  EXPECT_EQ(error.line, 2u);

  error = parseError("x = 1 +\n");
  EXPECT_EQ(error.message, "invalid syntax");
  EXPECT_EQ(error.line, 1u);
}

TEST_F(ParserTest, InvalidAssignmentTargets) {
  EXPECT_EQ(parseError("1 = x\n").message, "cannot assign to literal");
  EXPECT_EQ(parseError("f() = 1\n").message, "cannot assign to function call");
  EXPECT_EQ(parseError("a + b = 1\n").message, "cannot assign to expression");
}

TEST_F(ParserTest, StructuralErrors) {
  EXPECT_EQ(parseError("def f():\npass\n").message, "expected an indented block");
  EXPECT_EQ(parseError("  x = 1\n").message, "unexpected indent");
  EXPECT_EQ(parseError("try:\n    pass\nx = 1\n").message,
            "expected 'except' or 'finally' block");
  EXPECT_EQ(parseError("def f(a=1, b):\n    pass\n").message,
            "parameter without a default follows parameter with a default");
  EXPECT_EQ(parseError("def f()\n    pass\n").message, "expected ':'");
  EXPECT_EQ(parseError("s = b'a' 'b'\n").message, "cannot mix bytes and nonbytes literals");
  EXPECT_EQ(parseError("print 'hello'\n").message, "invalid syntax");
}
