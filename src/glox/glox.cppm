export module glox;

export import :AstPrinter;
export import :EnumFormatter;
export import :Environment;
export import :Error;
export import :Expr;
export import :ExprOperandConverter;
export import :Interpreter;
export import :Lox;
export import :Parser;
export import :ParserError;
export import :RuntimeError;
export import :Scanner;
export import :ScopeExit;
export import :SourceLocation;
export import :SourceText;
export import :Stmt;
export import :Token;
export import :Value;
export import :exits;
