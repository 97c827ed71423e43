#include "kernel_template.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>

static std::string make_kernel_source() {
    std::string src;

    // Frame markers shared with frame_protocol
    src += "READY = '" + std::string(FRAME_READY) + "'\n";
    src += "RUN = '" + std::string(FRAME_RUN) + "'\n";
    src += "OUT = '" + std::string(FRAME_OUT) + "'\n";
    src += "ERR = '" + std::string(FRAME_ERR) + "'\n";
    src += "ART = '" + std::string(FRAME_ART) + "'\n";
    src += "EXC = '" + std::string(FRAME_EXC) + "'\n";
    src += "DONE = '" + std::string(FRAME_DONE) + "'\n";

    src +=
        "import ast, base64, io, os, sys, traceback, uuid\n"
        "os.environ.setdefault('MPLBACKEND', 'Agg')\n"
        "\n"
        "_in, _out, _err = sys.stdin, sys.stdout, sys.stderr\n"
        "_g = {'__name__': '__main__'}\n"
        "\n"
        "def _b64(s):\n"
        "    if isinstance(s, str):\n"
        "        s = s.encode('utf-8', 'replace')\n"
        "    return base64.b64encode(s).decode('ascii')\n"
        "\n"
        "def _field(s):\n"
        "    return _b64(s) if s else '-'\n"
        "\n"
        "def _emit(line):\n"
        "    _out.write(line + '\\n')\n"
        "    _out.flush()\n"
        "\n"
        "class _Stream(io.TextIOBase):\n"
        "    def __init__(self, tag):\n"
        "        self.tag = tag\n"
        "        self.buf = ''\n"
        "    def writable(self):\n"
        "        return True\n"
        "    def write(self, s):\n"
        "        self.buf += s\n"
        "        while '\\n' in self.buf:\n"
        "            line, self.buf = self.buf.split('\\n', 1)\n"
        "            _emit(self.tag + ' ' + _b64(line))\n"
        "        return len(s)\n"
        "    def flush(self):\n"
        "        if self.buf:\n"
        "            _emit(self.tag + ' ' + _b64(self.buf))\n"
        "            self.buf = ''\n"
        "\n"
        "def _artifact(png, jpeg):\n"
        "    if png or jpeg:\n"
        "        _emit(ART + ' png=' + png + ' jpeg=' + jpeg)\n"
        "\n"
        "def _repr(obj, name):\n"
        "    fn = getattr(obj, name, None)\n"
        "    if fn is None:\n"
        "        return ''\n"
        "    try:\n"
        "        data = fn()\n"
        "    except Exception:\n"
        "        return ''\n"
        "    if not data:\n"
        "        return ''\n"
        "    if isinstance(data, tuple):\n"
        "        data = data[0]\n"
        "    return _b64(data) if isinstance(data, bytes) else str(data)\n"
        "\n"
        "def _figures():\n"
        "    plt = sys.modules.get('matplotlib.pyplot')\n"
        "    if plt is None:\n"
        "        return\n"
        "    for num in plt.get_fignums():\n"
        "        buf = io.BytesIO()\n"
        "        try:\n"
        "            plt.figure(num).savefig(buf, format='png', bbox_inches='tight')\n"
        "        except Exception:\n"
        "            continue\n"
        "        _artifact(_b64(buf.getvalue()), '')\n"
        "    plt.close('all')\n"
        "\n"
        "def _run(src):\n"
        "    so, se = _Stream(OUT), _Stream(ERR)\n"
        "    sys.stdout, sys.stderr, sys.stdin = so, se, io.StringIO('')\n"
        "    failure = None\n"
        "    value = None\n"
        "    try:\n"
        "        tree = ast.parse(src, '<cell>', 'exec')\n"
        "        last = None\n"
        "        if tree.body and isinstance(tree.body[-1], ast.Expr):\n"
        "            last = ast.Expression(tree.body.pop().value)\n"
        "        exec(compile(tree, '<cell>', 'exec'), _g)\n"
        "        if last is not None:\n"
        "            value = eval(compile(last, '<cell>', 'eval'), _g)\n"
        "    except BaseException as e:\n"
        "        tb = ''.join(traceback.format_exception(type(e), e, e.__traceback__))\n"
        "        failure = (type(e).__name__, str(e), tb.rstrip())\n"
        "    finally:\n"
        "        so.flush()\n"
        "        se.flush()\n"
        "        sys.stdout, sys.stderr, sys.stdin = _out, _err, _in\n"
        "    if value is not None:\n"
        "        _artifact(_repr(value, '_repr_png_'), _repr(value, '_repr_jpeg_'))\n"
        "    _figures()\n"
        "    if failure is not None:\n"
        "        _emit(EXC + ' ' + ' '.join(_field(f) for f in failure))\n"
        "    _emit(DONE)\n"
        "\n"
        "_emit(READY + ' sbx-' + uuid.uuid4().hex[:12])\n"
        "while True:\n"
        "    line = _in.readline()\n"
        "    if not line:\n"
        "        break\n"
        "    parts = line.split()\n"
        "    if not parts or parts[0] != RUN:\n"
        "        continue\n"
        "    code = base64.b64decode(parts[1]).decode('utf-8', 'replace') if len(parts) > 1 else ''\n"
        "    _run(code)\n";

    return src;
}

const std::string& kernel_source() {
    static const std::string source = make_kernel_source();
    return source;
}

std::string kernel_launch_command(const std::string& python) {
    return python + " -u -c \"import base64;exec(base64.b64decode('" +
           base64_encode(kernel_source()) + "').decode())\"";
}
