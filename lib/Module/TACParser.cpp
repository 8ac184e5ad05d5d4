//===-- TACParser.cpp -----------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Module/TACParser.h"

#include "tacsym/Module/TACProgram.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorOr.h"
#include "llvm/Support/LineIterator.h"
#include "llvm/Support/MemoryBuffer.h"

#include <system_error>

using namespace tacsym;
using llvm::StringRef;

namespace {

class TACParser {
  struct PendingBlock {
    TACBlock *block;
    unsigned line;
    std::string fallthrough;
    std::vector<std::string> successors;
  };

  std::unique_ptr<TACProgram> program;
  std::vector<PendingBlock> pendingBlocks;
  std::string entryName;
  unsigned entryLine;
  TACBlock *currentBlock;
  unsigned line;
  std::string &errorMsg;

  bool error(unsigned errorLine, const llvm::Twine &msg) {
    errorMsg = ("line " + llvm::Twine(errorLine) + ": " + msg).str();
    return false;
  }
  bool error(const llvm::Twine &msg) { return error(line, msg); }

  static void tokenize(StringRef text, llvm::SmallVectorImpl<StringRef> &out);
  bool parseOperands(StringRef text, std::vector<std::string> &out);
  bool parseConstant(StringRef text, ref<ConstantExpr> &result);

  bool parseFunction(llvm::ArrayRef<StringRef> tokens);
  bool parseBlock(llvm::ArrayRef<StringRef> tokens);
  bool parseEntry(llvm::ArrayRef<StringRef> tokens);
  bool parseStatement(StringRef text);
  bool finish();

public:
  explicit TACParser(std::string &_errorMsg)
      : program(new TACProgram()), entryLine(0), currentBlock(nullptr),
        line(0), errorMsg(_errorMsg) {}

  std::unique_ptr<TACProgram> parse(const llvm::MemoryBuffer &buffer);
};

void TACParser::tokenize(StringRef text,
                         llvm::SmallVectorImpl<StringRef> &out) {
  while (true) {
    std::pair<StringRef, StringRef> split = llvm::getToken(text);
    if (split.first.empty())
      return;
    out.push_back(split.first);
    text = split.second;
  }
}

bool TACParser::parseOperands(StringRef text, std::vector<std::string> &out) {
  text = text.trim();
  if (text.empty())
    return true;
  llvm::SmallVector<StringRef, 8> parts;
  text.split(parts, ',');
  for (StringRef part : parts) {
    part = part.trim();
    if (part.empty() || part.find_first_of(" \t") != StringRef::npos)
      return error("malformed operand list '" + text + "'");
    out.push_back(part.str());
  }
  return true;
}

bool TACParser::parseConstant(StringRef text, ref<ConstantExpr> &result) {
  llvm::APInt value;
  bool failed;
  if (text.startswith("0x") || text.startswith("0X"))
    failed = text.drop_front(2).empty() ||
             text.drop_front(2).getAsInteger(16, value);
  else
    failed = text.getAsInteger(10, value);
  if (failed)
    return error("malformed number '" + text + "'");
  if (value.getActiveBits() > Expr::Int256)
    return error("constant '" + text + "' does not fit in 256 bits");
  result = ConstantExpr::alloc(value.zextOrTrunc(Expr::Int256));
  return true;
}

/// Jump targets are looked up by printing the address as lowercase hex
/// without leading zeros, so a hex block id must already be in that form.
/// Ids that are not plain hex numbers are never jump targets and pass.
static bool isCanonicalBlockId(StringRef id, std::string &canonical) {
  if (!id.startswith("0x") && !id.startswith("0X"))
    return true;
  StringRef digits = id.drop_front(2);
  if (digits.empty() ||
      digits.find_first_not_of("0123456789abcdefABCDEF") != StringRef::npos)
    return true;
  StringRef trimmed = digits.ltrim('0');
  canonical = "0x" + (trimmed.empty() ? std::string("0") : trimmed.lower());
  return id == canonical;
}

bool TACParser::parseFunction(llvm::ArrayRef<StringRef> tokens) {
  if (tokens.size() < 3)
    return error("expected 'function <id> <name>'");

  std::string err;
  TACFunction *f = program->addFunction(tokens[1].str(), tokens[2].str(), err);
  if (!f)
    return error(err);

  bool inArgs = false;
  for (StringRef tok : tokens.drop_front(3)) {
    if (tok == "public") {
      f->isPublic = true;
      inArgs = false;
    } else if (tok == "args") {
      inArgs = true;
    } else if (inArgs) {
      f->arguments.push_back(tok.str());
    } else {
      return error("unexpected '" + tok + "' in function declaration");
    }
  }
  currentBlock = nullptr;
  return true;
}

bool TACParser::parseBlock(llvm::ArrayRef<StringRef> tokens) {
  if (tokens.size() < 3)
    return error("expected 'block <id> <function-id>'");

  std::string canonical;
  if (!isCanonicalBlockId(tokens[1], canonical))
    return error("block id '" + tokens[1] + "' is not canonical, expected '" +
                 canonical + "'");

  TACFunction *f = program->getFunction(tokens[2].str());
  if (!f)
    return error("unknown function '" + tokens[2] + "'");

  std::string err;
  TACBlock *bb = program->addBlock(tokens[1].str(), f, err);
  if (!bb)
    return error(err);

  PendingBlock pending;
  pending.block = bb;
  pending.line = line;
  for (unsigned i = 3; i < tokens.size(); ++i) {
    if (tokens[i] == "fallthrough") {
      if (i + 1 >= tokens.size())
        return error("expected a block id after 'fallthrough'");
      pending.fallthrough = tokens[++i].str();
    } else if (tokens[i] == "succ") {
      for (++i; i < tokens.size() && tokens[i] != "fallthrough"; ++i)
        pending.successors.push_back(tokens[i].str());
      --i;
    } else {
      return error("unexpected '" + tokens[i] + "' in block declaration");
    }
  }
  pendingBlocks.push_back(pending);
  currentBlock = bb;
  return true;
}

bool TACParser::parseEntry(llvm::ArrayRef<StringRef> tokens) {
  if (tokens.size() != 2)
    return error("expected 'entry <block-id>'");
  entryName = tokens[1].str();
  entryLine = line;
  return true;
}

bool TACParser::parseStatement(StringRef text) {
  if (!currentBlock)
    return error("statement outside of a block");

  if (!text.contains(':'))
    return error("expected '<id>: ...'");
  std::pair<StringRef, StringRef> idSplit = text.split(':');
  StringRef id = idSplit.first.trim();
  if (id.empty() || id.find_first_of(" \t") != StringRef::npos)
    return error("malformed statement id '" + id + "'");

  StringRef body = idSplit.second.trim();
  std::vector<std::string> results;
  if (body.contains('=')) {
    std::pair<StringRef, StringRef> eqSplit = body.split('=');
    if (!parseOperands(eqSplit.first, results))
      return false;
    if (results.empty())
      return error("expected result variables before '='");
    body = eqSplit.second.trim();
  }

  std::pair<StringRef, StringRef> opSplit = llvm::getToken(body);
  StringRef opName = opSplit.first;
  if (opName.empty())
    return error("missing opcode");
  TACStatement::Opcode opcode = TACStatement::getOpcodeByName(opName);
  if (opcode == TACStatement::InvalidOpcode)
    return error("unknown opcode '" + opName + "'");
  if (opcode == TACStatement::SIMPROCEDURE)
    return error("SIMPROCEDURE statements are installed by the engine");

  std::unique_ptr<TACStatement> stmt(new TACStatement(opcode, id.str()));
  stmt->line = line;
  stmt->resVars = std::move(results);

  StringRef operands = opSplit.second.trim();
  if (opcode == TACStatement::CONST) {
    if (operands.empty())
      return error("CONST requires an immediate");
    if (!parseConstant(operands, stmt->value))
      return false;
  } else if (!parseOperands(operands, stmt->argVars)) {
    return false;
  }

  int numArgs = TACStatement::getNumArgs(opcode);
  if (numArgs >= 0 && stmt->argVars.size() != static_cast<unsigned>(numArgs))
    return error(llvm::Twine(opName) + " expects " + llvm::Twine(numArgs) +
                 " operand(s), got " + llvm::Twine(stmt->argVars.size()));
  int numResults = TACStatement::getNumResults(opcode);
  if (numResults >= 0 &&
      stmt->resVars.size() != static_cast<unsigned>(numResults))
    return error(llvm::Twine(opName) + " expects " + llvm::Twine(numResults) +
                 " result(s), got " + llvm::Twine(stmt->resVars.size()));
  if ((opcode == TACStatement::CALLPRIVATE ||
       opcode == TACStatement::RETURNPRIVATE) &&
      stmt->argVars.empty())
    return error(llvm::Twine(opName) + " expects at least one operand");

  std::string err;
  if (!program->addStatement(currentBlock, std::move(stmt), err))
    return error(err);
  return true;
}

bool TACParser::finish() {
  for (const PendingBlock &pending : pendingBlocks) {
    TACBlock *bb = pending.block;
    if (bb->statements.empty())
      return error(pending.line, "block '" + bb->id + "' has no statements");
    if (!pending.fallthrough.empty()) {
      bb->fallthrough = program->getBlock(pending.fallthrough);
      if (!bb->fallthrough || bb->fallthrough == program->getFakeExit())
        return error(pending.line,
                     "unknown fallthrough block '" + pending.fallthrough + "'");
    }
    for (const std::string &succ : pending.successors) {
      TACBlock *target = program->getBlock(succ);
      if (!target || target == program->getFakeExit())
        return error(pending.line, "unknown successor block '" + succ + "'");
      bb->successors.push_back(target);
    }
  }

  for (const auto &f : program->getFunctions()) {
    if (f->blocks.empty())
      return error(0, "function '" + f->name + "' has no blocks");
    f->entry = f->blocks.front();
    for (TACBlock *bb : f->blocks) {
      if (bb->id == f->id) {
        f->entry = bb;
        break;
      }
    }
  }

  if (!entryName.empty()) {
    TACBlock *entry = program->getBlock(entryName);
    if (!entry || entry == program->getFakeExit())
      return error(entryLine, "unknown entry block '" + entryName + "'");
    program->setEntryBlock(entry);
  } else if (!pendingBlocks.empty()) {
    program->setEntryBlock(pendingBlocks.front().block);
  } else {
    return error(0, "program has no blocks");
  }
  return true;
}

std::unique_ptr<TACProgram>
TACParser::parse(const llvm::MemoryBuffer &buffer) {
  for (llvm::line_iterator it(buffer, /*SkipBlanks=*/false); !it.is_at_eof();
       ++it) {
    line = it.line_number();
    StringRef text = *it;
    text = text.take_until([](char c) { return c == '#'; }).trim();
    if (text.empty())
      continue;

    llvm::SmallVector<StringRef, 8> tokens;
    tokenize(text, tokens);

    bool ok;
    if (tokens[0] == "function")
      ok = parseFunction(tokens);
    else if (tokens[0] == "block")
      ok = parseBlock(tokens);
    else if (tokens[0] == "entry")
      ok = parseEntry(tokens);
    else
      ok = parseStatement(text);
    if (!ok)
      return nullptr;
  }

  if (!finish())
    return nullptr;
  return std::move(program);
}

} // namespace

namespace tacsym {

std::unique_ptr<TACProgram> parseTAC(const llvm::MemoryBuffer &buffer,
                                     std::string &errorMsg) {
  TACParser parser(errorMsg);
  return parser.parse(buffer);
}

std::unique_ptr<TACProgram> parseTAC(StringRef text, std::string &errorMsg) {
  std::unique_ptr<llvm::MemoryBuffer> buffer =
      llvm::MemoryBuffer::getMemBufferCopy(text, "<input>");
  return parseTAC(*buffer, errorMsg);
}

std::unique_ptr<TACProgram> loadTACFile(const std::string &path,
                                        std::string &errorMsg) {
  llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer> > bufferOrErr =
      llvm::MemoryBuffer::getFile(path);
  if (std::error_code ec = bufferOrErr.getError()) {
    errorMsg = "cannot open '" + path + "': " + ec.message();
    return nullptr;
  }
  std::unique_ptr<TACProgram> program = parseTAC(**bufferOrErr, errorMsg);
  if (!program)
    errorMsg = path + ":" + errorMsg;
  return program;
}

} // namespace tacsym
