#include "diagnostics.hpp"
#include "runtime/environment.hpp"
#include "runtime/executor.hpp"
#include "script/parser.hpp"
#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// Everything one executor run needs, with I/O captured in memory.
struct Harness {
  Environment env;
  std::istringstream in;
  std::ostringstream out;
  std::ostringstream echo;
  Diagnostics diag;
  std::vector<double> sleeps;

  explicit Harness(const std::string &input = "", bool verbose = false)
      : in(input), diag(verbose, &echo) {}

  ExecutionMetrics run(const std::string &src, ExecutorOptions opts = {}) {
    Script script = parse_script(src, &diag);
    Executor exec(env, in, out, diag, [this](Seconds d) { sleeps.push_back(d.count()); },
                  opts);
    exec.run(script);
    return exec.metrics();
  }
};

int main() {
  std::cout << "Running executor unit tests...\n";

  // === Test 1: assign then say ===
  {
    Harness h;
    h.run("start\nX=\"A\"\nsay \"{X}\"\nend\n");
    assert(h.out.str() == "A\n");
    assert(h.env.get("X") == "A");
    std::cout << "Test 1 passed: assign + say.\n";
  }

  // === Test 2: assignment literals are interpolated when executed ===
  {
    Harness h;
    h.run("start\nFirst=Indy\nFull=\"{First} Jones\"\nFirst=Henry\nsay \"{Full} / {First}\"\nend");
    assert(h.out.str() == "Indy Jones / Henry\n");
    std::cout << "Test 2 passed: assignment interpolation.\n";
  }

  // === Test 3: if/else picks the branch by exact string comparison ===
  {
    const std::string src =
        "start\n"
        "if UserDecision == \"yes\"\n"
        "say \"then\"\n"
        "else\n"
        "say \"else\"\n"
        "end if\n"
        "end\n";

    Harness yes;
    yes.env.set("UserDecision", "yes");
    yes.run(src);
    assert(yes.out.str() == "then\n");

    Harness no;
    no.env.set("UserDecision", "no");
    no.run(src);
    assert(no.out.str() == "else\n");

    Harness padded;
    padded.env.set("UserDecision", "yes ");
    padded.run(src);
    assert(padded.out.str() == "else\n");

    Harness upper;
    upper.env.set("UserDecision", "YES");
    upper.run(src);
    assert(upper.out.str() == "else\n");
    std::cout << "Test 3 passed: if/else selection.\n";
  }

  // === Test 4: != and missing else ===
  {
    Harness h;
    h.run("start\nA=1\nif A != \"1\"\nsay \"no\"\nend if\nif A != \"2\"\nsay \"yes\"\nend if\nend");
    assert(h.out.str() == "yes\n");
    std::cout << "Test 4 passed: != operator.\n";
  }

  // === Test 5: operand forms ===
  {
    Harness h;
    h.env.set("First", "ab");
    h.env.set("Second", "ab");
    h.env.set("Left", "a");
    h.env.set("Right", "b");
    h.run("start\n"
          "if First == Second\nsay \"vars\"\nend if\n"
          "if \"{Left}{Right}\" == \"ab\"\nsay \"template\"\nend if\n"
          "if Missing == \"\"\nsay \"undefined is empty\"\nend if\n"
          "if First == Undefined\nsay \"wrong\"\nelse\nsay \"bare literal\"\nend if\n"
          "end");
    assert(h.out.str() == "vars\ntemplate\nundefined is empty\nbare literal\n");

    Executor direct(h.env, h.in, h.out, h.diag, [](Seconds) {});
    Condition c;
    c.left = {"First", false, true};
    c.op = CompareOp::EQ;
    c.right = {"{Left}", true, false};
    // quoted right operands are literal, never interpolated
    assert(!direct.evaluate(c));
    std::cout << "Test 5 passed: operand forms.\n";
  }

  // === Test 6: loops are skipped, siblings still run ===
  {
    Harness h("", true);
    ExecutionMetrics m = h.run("start\nsay \"before\"\nloop 3\nsay \"X\"\nend loop\nsay \"after\"\nend");
    assert(h.out.str() == "before\nafter\n");
    assert(m.loops_skipped == 1);
    assert(h.echo.str().find("Loop encountered (3)") != std::string::npos);

    Harness f;
    f.run("start\nloop forever\nN=1\nwait 9\nend loop\nsay \"done {N}\"\nend");
    assert(f.out.str() == "done \n");
    assert(f.sleeps.empty());
    assert(!f.env.contains("N"));
    std::cout << "Test 6 passed: simulated loop skip.\n";
  }

  // === Test 7: wait calls the sleep primitive, wait 0 included ===
  {
    Harness h;
    ExecutionMetrics m = h.run("start\nwait 0\nsay \"a\"\nwait 1.5\nsay \"b\"\nend");
    assert(h.sleeps.size() == 2);
    assert(h.sleeps[0] == 0.0);
    assert(h.sleeps[1] == 1.5);
    assert(m.total_wait_seconds == 1.5);
    assert(h.out.str() == "a\nb\n");
    std::cout << "Test 7 passed: wait.\n";
  }

  // === Test 8: prompt shows message + separator and stores the line ===
  {
    Harness h("Indiana\r\n  spaced  \n");
    h.run("start\nWho=\"name\"\nprompt Name=\"Your {Who}\"\nprompt Other=\"Again\"\n"
          "say \"Hi {Name}|{Other}|\"\nend");
    assert(h.out.str() == "Your name: Again: Hi Indiana|  spaced  |\n");
    assert(h.env.get("Name") == "Indiana");
    std::cout << "Test 8 passed: prompt.\n";
  }

  // === Test 9: prompt options ===
  {
    Harness h("  padded  \n");
    ExecutorOptions opts;
    opts.prompt_separator = " > ";
    opts.trim_prompt_input = true;
    h.run("start\nprompt V=\"Value\"\nend", opts);
    assert(h.out.str() == "Value > ");
    assert(h.env.get("V") == "padded");
    std::cout << "Test 9 passed: prompt separator/trim options.\n";
  }

  // === Test 10: prompt at end of input stores "" and warns ===
  {
    Harness h("");
    h.run("start\nprompt Answer=\"?\"\nsay \"[{Answer}]\"\nend");
    assert(h.env.contains("Answer"));
    assert(h.env.get("Answer").empty());
    assert(h.out.str() == "?: []\n");
    assert(h.diag.count(Severity::WARNING) == 1);
    std::cout << "Test 10 passed: prompt without input.\n";
  }

  // === Test 11: unknown lines are silent unless verbose ===
  {
    Harness quiet;
    ExecutionMetrics m = quiet.run("start\nfly away\nsay \"ok\"\nend");
    assert(quiet.out.str() == "ok\n");
    assert(quiet.echo.str().empty());
    assert(m.unknown_lines == 1);
    assert(quiet.diag.count(Severity::WARNING) == 1);

    Harness loud("", true);
    loud.run("start\nfly away\nsay \"ok\"\nend");
    assert(loud.out.str() == "ok\n");
    assert(loud.echo.str().find("line 2: unknown command or bad syntax: 'fly away'") !=
           std::string::npos);
    std::cout << "Test 11 passed: unknown lines.\n";
  }

  // === Test 12: verbose start/finish/wait messages ===
  {
    Harness h("", true);
    h.run("start\nwait 2\nend");
    const std::string log = h.echo.str();
    assert(log.find("[Indy Engine] line 1: Script started.") != std::string::npos);
    assert(log.find("Waiting for 2 seconds...") != std::string::npos);
    assert(log.find("Script finished.") != std::string::npos);
    std::cout << "Test 12 passed: verbose engine messages.\n";
  }

  // === Test 13: nested blocks execute fully before the next sibling ===
  {
    Harness h;
    h.env.set("A", "1");
    h.env.set("B", "2");
    ExecutionMetrics m = h.run("start\n"
                               "if A == \"1\"\n"
                               "say \"outer\"\n"
                               "if B == \"2\"\n"
                               "say \"inner\"\n"
                               "else\n"
                               "say \"not here\"\n"
                               "end if\n"
                               "say \"outer again\"\n"
                               "end if\n"
                               "say \"last\"\n"
                               "end");
    assert(h.out.str() == "outer\ninner\nouter again\nlast\n");
    assert(m.branches_taken == 2);
    std::cout << "Test 13 passed: nested execution order.\n";
  }

  // === Test 14: very deep taken ifs run without exhausting the stack ===
  {
    const int depth = 50000;
    std::string src = "start\n";
    for (int i = 0; i < depth; ++i)
      src += "if A == \"1\"\n";
    src += "say \"deep\"\n";
    for (int i = 0; i < depth; ++i)
      src += "end if\n";
    src += "say \"after\"\nend\n";

    Harness h;
    h.env.set("A", "1");
    ExecutionMetrics m = h.run(src);
    assert(h.out.str() == "deep\nafter\n");
    assert(m.branches_taken == static_cast<uint32_t>(depth));
    std::cout << "Test 14 passed: deep nesting.\n";
  }

  std::cout << "All executor tests passed successfully.\n";
  return 0;
}
