#include <pdfscrub/ScrubContent.hh>

#include <pdfscrub/BufferInputSource.hh>
#include <pdfscrub/ScrubMatrix.hh>
#include <pdfscrub/ScrubTokenizer.hh>
#include <pdfscrub/ScrubUtil.hh>
#include <pdfscrub/Util.hh>

#include <cstdlib>
#include <optional>
#include <set>

using namespace pdfscrub;

namespace
{
    double
    num(std::vector<std::string> const& operands, size_t from_end)
    {
        // Operand counted from the end, so extra leading operands are ignored.
        if (from_end >= operands.size()) {
            return 0.0;
        }
        return std::strtod(operands.at(operands.size() - 1 - from_end).c_str(), nullptr);
    }

    ScrubMatrix
    matrix_operand(std::vector<std::string> const& operands)
    {
        return {
            num(operands, 5),
            num(operands, 4),
            num(operands, 3),
            num(operands, 2),
            num(operands, 1),
            num(operands, 0)};
    }

    struct TextState
    {
        ScrubMatrix tm;
        ScrubMatrix tlm;
        double leading{0};
    };
} // namespace

namespace pdfscrub::content
{
    Analysis
    analyze(std::string const& data)
    {
        Analysis result;
        result.size = data.size();
        BufferInputSource input("content stream", data);
        ScrubTokenizer tokenizer;
        tokenizer.allowEOF();
        tokenizer.includeIgnorable();

        Operation current;
        size_t pending = 0;
        while (true) {
            auto token = tokenizer.readToken(input, "content stream", true);
            auto len = static_cast<size_t>(input.tell() - input.getLastOffset());
            auto type = token.getType();
            if (type == ScrubTokenizer::tt_eof) {
                break;
            } else if (type == ScrubTokenizer::tt_space) {
                continue;
            } else if (type == ScrubTokenizer::tt_comment) {
                result.comment_bytes += len;
            } else if (type == ScrubTokenizer::tt_bad) {
                ++result.bad_tokens;
                pending += len;
            } else if (type == ScrubTokenizer::tt_word) {
                current.op = token.getValue();
                if (current.op == "ID") {
                    // Skip the single white-space character after ID.
                    char ch;
                    input.read(&ch, 1);
                    tokenizer.expectInlineImage(input);
                    auto image = tokenizer.readToken(input, "content stream", true);
                    if (image.getType() == ScrubTokenizer::tt_inline_image) {
                        current.inline_image = image.getValue();
                    } else {
                        ++result.bad_tokens;
                    }
                }
                result.operations.emplace_back(std::move(current));
                current = Operation();
                pending = 0;
            } else {
                current.operands.emplace_back(token.getRawValue());
                pending += len;
            }
        }
        result.trailing_bytes = pending;
        return result;
    }

    std::string
    unparse(std::vector<Operation> const& operations)
    {
        std::string result;
        for (auto const& operation: operations) {
            for (auto const& operand: operation.operands) {
                result += operand;
                result += ' ';
            }
            result += operation.op;
            if (operation.op == "ID") {
                result += ' ';
                result += operation.inline_image;
                if (operation.inline_image.empty() ||
                    !util::is_space(operation.inline_image.back())) {
                    result += '\n';
                }
                continue;
            }
            result += '\n';
        }
        return result;
    }

    std::vector<size_t>
    off_page_text(
        std::vector<Operation> const& operations,
        Box const& box,
        double tolerance,
        std::string* evidence)
    {
        std::vector<size_t> result;
        std::vector<ScrubMatrix> stack;
        ScrubMatrix ctm;
        TextState ts;
        bool in_text = false;
        size_t bt_index = 0;
        bool flagged = false;

        auto show = [&]() {
            if (!in_text || flagged) {
                return;
            }
            double x = 0;
            double y = 0;
            ctm.transform(ts.tm.e, ts.tm.f, x, y);
            if (x < box.llx - tolerance || x > box.urx + tolerance || y < box.lly - tolerance ||
                y > box.ury + tolerance) {
                flagged = true;
                result.push_back(bt_index);
                if (evidence && evidence->empty()) {
                    *evidence = "text origin (" + ScrubUtil::double_to_string(x, 2) + ", " +
                        ScrubUtil::double_to_string(y, 2) + ") outside box [" +
                        ScrubUtil::double_to_string(box.llx, 2) + " " +
                        ScrubUtil::double_to_string(box.lly, 2) + " " +
                        ScrubUtil::double_to_string(box.urx, 2) + " " +
                        ScrubUtil::double_to_string(box.ury, 2) + "]";
                }
            }
        };
        auto next_line = [&ts](double tx, double ty) {
            ts.tlm.translate(tx, ty);
            ts.tm = ts.tlm;
        };

        for (size_t i = 0; i < operations.size(); ++i) {
            auto const& o = operations.at(i);
            auto const& op = o.op;
            if (op == "q") {
                stack.push_back(ctm);
            } else if (op == "Q") {
                if (!stack.empty()) {
                    ctm = stack.back();
                    stack.pop_back();
                }
            } else if (op == "cm") {
                ctm.concat(matrix_operand(o.operands));
            } else if (op == "BT") {
                in_text = true;
                flagged = false;
                bt_index = i;
                ts.tm = ScrubMatrix();
                ts.tlm = ScrubMatrix();
            } else if (op == "ET") {
                in_text = false;
            } else if (op == "Td") {
                next_line(num(o.operands, 1), num(o.operands, 0));
            } else if (op == "TD") {
                ts.leading = -num(o.operands, 0);
                next_line(num(o.operands, 1), num(o.operands, 0));
            } else if (op == "Tm") {
                ts.tm = ts.tlm = matrix_operand(o.operands);
            } else if (op == "TL") {
                ts.leading = num(o.operands, 0);
            } else if (op == "T*") {
                next_line(0, -ts.leading);
            } else if (op == "Tj" || op == "TJ") {
                show();
            } else if (op == "'") {
                next_line(0, -ts.leading);
                show();
            } else if (op == "\"") {
                next_line(0, -ts.leading);
                show();
            }
        }
        return result;
    }

    std::vector<Operation>
    remove_text_objects(std::vector<Operation> const& operations, std::vector<size_t> const& bts)
    {
        std::set<size_t> starts(bts.begin(), bts.end());
        std::vector<Operation> result;
        bool skipping = false;
        for (size_t i = 0; i < operations.size(); ++i) {
            auto const& o = operations.at(i);
            if (starts.contains(i) && o.op == "BT") {
                skipping = true;
            }
            if (!skipping) {
                result.push_back(o);
            }
            if (skipping && o.op == "ET") {
                skipping = false;
            }
        }
        return result;
    }

    std::vector<size_t>
    optional_content(
        std::vector<Operation> const& operations, std::set<std::string> const& properties)
    {
        std::vector<size_t> result;
        size_t depth = 0;
        // Depth outside the sequence being reported, while inside one
        std::optional<size_t> outer;
        for (size_t i = 0; i < operations.size(); ++i) {
            auto const& o = operations.at(i);
            if (o.op == "BDC" || o.op == "BMC") {
                auto n = o.operands.size();
                if (!outer && o.op == "BDC" && n >= 2 && o.operands.at(n - 2) == "/OC" &&
                    properties.contains(o.operands.at(n - 1))) {
                    outer = depth;
                    result.push_back(i);
                }
                ++depth;
            } else if (o.op == "EMC" && depth > 0) {
                --depth;
                if (outer && *outer == depth) {
                    outer.reset();
                }
            }
        }
        return result;
    }

    std::vector<Operation>
    remove_marked_content(
        std::vector<Operation> const& operations, std::vector<size_t> const& starts)
    {
        std::set<size_t> first(starts.begin(), starts.end());
        std::vector<Operation> result;
        size_t depth = 0;
        std::optional<size_t> outer;
        for (size_t i = 0; i < operations.size(); ++i) {
            auto const& o = operations.at(i);
            if (!outer && o.op == "BDC" && first.contains(i)) {
                outer = depth;
            }
            if (o.op == "BDC" || o.op == "BMC") {
                ++depth;
            } else if (o.op == "EMC" && depth > 0) {
                --depth;
                if (outer && *outer == depth) {
                    outer.reset();
                    continue;
                }
            }
            if (!outer) {
                result.push_back(o);
            }
        }
        return result;
    }
} // namespace pdfscrub::content
