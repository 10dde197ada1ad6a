/**
 * @file javascript_prelude.cpp
 * @brief Node.js host prelude: vm context with an explicit global set
 *
 * Guest code never receives a host-realm object with a reachable prototype:
 * host bridges are null-prototype frozen functions returning primitives, and
 * every guest-visible global is built inside the context by a bootstrap script.
 * The reverse holds too: guest values are formatted and serialized inside the
 * context, and the host only ever reads the resulting strings.
 */

#include "preludes.hpp"

namespace secbox::engine {

namespace {

constexpr std::string_view kJavaScriptPrelude = R"JS('use strict';
const fs = require('fs');
const vm = require('vm');

const NETWORK_MODULES = new Set(['http', 'https', 'http2', 'net', 'dgram', 'tls', 'dns']);
const IDENTIFIER = /^[A-Za-z_$][\w$]*$/;

function send(event, fields) {
  fs.writeSync(3, JSON.stringify(Object.assign({ event }, fields || {})) + '\n');
}

function write(text) {
  fs.writeSync(1, text);
}

const payload = JSON.parse(fs.readFileSync(process.argv[2], 'utf8'));
const inputs = Array.isArray(payload.inputs) ? payload.inputs.slice() : [];
const hidden = Array.isArray(payload.hiddenPrefixes) ? payload.hiddenPrefixes : [];
const maxDepth = Number(payload.maxRecursionDepth) > 0 ? Number(payload.maxRecursionDepth) : 0;
const GUEST_FILE = 'sandbox.js';

function harden(fn) {
  return Object.freeze(Object.setPrototypeOf(fn, null));
}

function guard(fn, fallback) {
  return harden(function (...args) {
    try {
      return fn(...args);
    } catch (error) {
      return fallback;
    }
  });
}

const timers = new Map();
let nextTimer = 1;

function schedule(callback, ms, repeat) {
  const id = nextTimer++;
  const delay = Math.max(0, Number(ms) || 0);
  const run = () => {
    if (!repeat) {
      timers.delete(id);
    }
    callback();
  };
  timers.set(id, repeat ? setInterval(run, delay) : setTimeout(run, delay));
  return id;
}

function cancelTimer(id) {
  const handle = timers.get(Number(id));
  if (handle !== undefined) {
    clearTimeout(handle);
    clearInterval(handle);
    timers.delete(Number(id));
  }
}

// Guest frames on the current stack; the top-level script frame counts as one
function guestDepth() {
  const savedPrepare = Error.prepareStackTrace;
  const savedLimit = Error.stackTraceLimit;
  Error.prepareStackTrace = (holder, frames) => frames;
  Error.stackTraceLimit = maxDepth + 16;
  const holder = {};
  Error.captureStackTrace(holder, guestDepth);
  const frames = holder.stack;
  Error.prepareStackTrace = savedPrepare;
  Error.stackTraceLimit = savedLimit;
  let depth = 0;
  for (const frame of frames) {
    if (frame.getFileName() === GUEST_FILE) {
      ++depth;
    }
  }
  return depth;
}

function blockedMessage(target) {
  return `Network access to ${target} is not allowed in the sandbox`;
}

const host = Object.freeze(Object.assign(Object.create(null), {
  print: guard((text) => {
    if (typeof text === 'string') {
      write(text + '\n');
    }
  }, undefined),
  prompt: guard((message) => {
    if (inputs.length === 0) {
      write(message);
      return null;
    }
    const value = String(inputs.shift());
    write(message + value + '\n');
    return value;
  }, null),
  network: guard((target) => {
    send('network', { target });
    return blockedMessage(target);
  }, 'Network access is not allowed in the sandbox'),
  require: guard((name) => {
    const id = name.replace(/^node:/, '').split('/')[0];
    if (NETWORK_MODULES.has(id)) {
      send('network', { target: id });
      return blockedMessage(id);
    }
    return `Module '${name}' is not available in the sandbox`;
  }, 'Modules are not available in the sandbox'),
  dom: guard(() => { send('dom'); }, undefined),
  schedule: guard((callback, ms, repeat) => schedule(callback, ms, repeat === true), 0),
  cancel: guard((id) => { cancelTimer(id); }, undefined),
  enter: guard(() => {
    if (maxDepth > 0 && guestDepth() > maxDepth + 1) {
      finish({ kind: 'ResourceExceeded', message: 'Maximum recursion depth exceeded' });
    }
  }, undefined),
}));

// Runs inside the context. Formatting never calls inspection hooks or getters,
// and everything handed back to the host is a primitive string.
const BOOTSTRAP = `(function (host) {
  'use strict';
  const g = globalThis;
  const IDENTIFIER = /^[A-Za-z_$][A-Za-z0-9_$]*$/;
  const MAX_DEPTH = 2;
  const MAX_ITEMS = 100;
  const stringify = JSON.stringify;
  const functionSource = Function.prototype.toString;

  const show = (value, depth, seen) => {
    if (value === null) {
      return 'null';
    }
    switch (typeof value) {
      case 'undefined':
        return 'undefined';
      case 'string':
        return depth === 0 ? value : "'" + value + "'";
      case 'number':
        return Object.is(value, -0) ? '-0' : String(value);
      case 'bigint':
        return String(value) + 'n';
      case 'boolean':
        return String(value);
      case 'symbol':
        return Symbol.prototype.toString.call(value);
      case 'function': {
        const name = value.name || '(anonymous)';
        let source = '';
        try {
          source = functionSource.call(value);
        } catch (error) {
          source = '';
        }
        return source.startsWith('class') ? '[class ' + name + ']' : '[Function: ' + name + ']';
      }
      default:
        break;
    }
    if (seen.includes(value)) {
      return '[Circular]';
    }
    if (value instanceof Error) {
      const text = String(value.name) + ': ' + String(value.message);
      return depth === 0 && typeof value.stack === 'string' ? value.stack : '[' + text + ']';
    }
    if (value instanceof Date) {
      return Number.isNaN(value.getTime()) ? 'Invalid Date' : value.toISOString();
    }
    if (value instanceof RegExp) {
      return RegExp.prototype.toString.call(value);
    }
    if (value instanceof Promise) {
      return 'Promise {}';
    }
    if (depth > MAX_DEPTH) {
      return Array.isArray(value) ? '[Array]' : '[Object]';
    }
    const inner = seen.concat([value]);
    const item = (entry) => show(entry, depth + 1, inner);
    if (Array.isArray(value)) {
      const parts = [];
      for (let i = 0; i < value.length && i < MAX_ITEMS; ++i) {
        parts.push(item(value[i]));
      }
      if (value.length > MAX_ITEMS) {
        parts.push('... ' + (value.length - MAX_ITEMS) + ' more items');
      }
      return parts.length === 0 ? '[]' : '[ ' + parts.join(', ') + ' ]';
    }
    if (value instanceof Map || value instanceof Set) {
      const parts = [];
      for (const entry of value) {
        if (parts.length === MAX_ITEMS) {
          break;
        }
        parts.push(value instanceof Map ? item(entry[0]) + ' => ' + item(entry[1]) : item(entry));
      }
      const kind = value instanceof Map ? 'Map' : 'Set';
      return kind + '(' + value.size + ') ' + (parts.length === 0 ? '{}' : '{ ' + parts.join(', ') + ' }');
    }
    const parts = [];
    for (const key of Object.keys(value).slice(0, MAX_ITEMS)) {
      const descriptor = Object.getOwnPropertyDescriptor(value, key);
      const label = IDENTIFIER.test(key) ? key : "'" + key + "'";
      if (descriptor && (descriptor.get || descriptor.set)) {
        parts.push(label + ': ' + (descriptor.get && descriptor.set ? '[Getter/Setter]' : descriptor.get ? '[Getter]' : '[Setter]'));
      } else {
        parts.push(label + ': ' + item(descriptor ? descriptor.value : undefined));
      }
    }
    const proto = Object.getPrototypeOf(value);
    const owner = proto === null ? '[Object: null prototype]'
      : proto === Object.prototype ? ''
      : (Object.getOwnPropertyDescriptor(proto, 'constructor') || {}).value;
    const tag = typeof owner === 'function' ? owner.name : typeof owner === 'string' ? owner : '';
    const body = parts.length === 0 ? '{}' : '{ ' + parts.join(', ') + ' }';
    return tag ? tag + ' ' + body : body;
  };

  const SPECIFIER = /%([sdifjoO%])/g;
  const format = (args) => {
    if (typeof args[0] !== 'string' || args.length < 2 || !args[0].includes('%')) {
      return args.map((arg) => show(arg, 0, [])).join(' ');
    }
    let index = 1;
    const head = args[0].replace(SPECIFIER, (match, spec) => {
      if (spec === '%') {
        return '%';
      }
      if (index >= args.length) {
        return match;
      }
      const arg = args[index++];
      switch (spec) {
        case 's':
          return typeof arg === 'string' ? arg : show(arg, 1, []);
        case 'd':
          return typeof arg === 'symbol' ? 'NaN' : String(Number(arg));
        case 'i':
          return typeof arg === 'symbol' ? 'NaN' : String(parseInt(arg, 10));
        case 'f':
          return typeof arg === 'symbol' ? 'NaN' : String(parseFloat(arg));
        case 'j':
          try {
            return stringify(arg);
          } catch (error) {
            return '[Circular]';
          }
        default:
          return show(arg, 1, []);
      }
    });
    return [head].concat(args.slice(index).map((arg) => show(arg, 0, []))).join(' ');
  };

  const printable = (args) => {
    try {
      return format(args);
    } catch (error) {
      return '[unprintable value]';
    }
  };

  const snapshot = (value) => {
    if (value === undefined) {
      return undefined;
    }
    try {
      if (typeof value === 'number' && !Number.isFinite(value)) {
        return stringify(String(value));
      }
      if (typeof value === 'bigint' || typeof value === 'symbol' || typeof value === 'function') {
        return stringify(show(value, 1, []));
      }
      if (value !== null && typeof value === 'object') {
        try {
          const text = stringify(value);
          if (typeof text === 'string' && text.length <= 65536) {
            return text;
          }
        } catch (error) {
          // cyclic or throwing toJSON: fall back to the printed form
        }
        return stringify(show(value, 1, []).slice(0, 1024));
      }
      return stringify(value);
    } catch (error) {
      return stringify('<unrepresentable>');
    }
  };

  const explain = (error) => {
    try {
      if (error instanceof RangeError && /call stack/i.test(String(error.message))) {
        return stringify({ kind: 'ResourceExceeded', message: 'Maximum recursion depth exceeded' });
      }
      if (error !== null && typeof error === 'object' && 'message' in error) {
        return stringify({ kind: 'RuntimeFault', message: String(error.name || 'Error') + ': ' + String(error.message) });
      }
      return stringify({ kind: 'RuntimeFault', message: 'Uncaught ' + show(error, 1, []) });
    } catch (failure) {
      return stringify({ kind: 'RuntimeFault', message: 'Uncaught exception' });
    }
  };

  const blocked = (target) => new Error(host.network(String(target)));
  const define = (name, value) => Object.defineProperty(g, name, { value, writable: true, configurable: true });
  const log = function (...args) { host.print(printable(args)); };
  Object.defineProperty(g, '__secbox_enter', { value: function () { host.enter(); } });
  // Call sites handed to a stack formatter can describe host frames
  Object.defineProperty(Error, 'prepareStackTrace', { value: undefined, writable: false, configurable: false });
  define('console', Object.freeze({ log, info: log, debug: log, warn: log, error: log, trace: log }));
  define('prompt', function prompt(message) { return host.prompt(message === undefined ? '' : String(message)); });
  define('fetch', function fetch(resource) {
    const target = typeof resource === 'string' ? resource : (resource && resource.url) || 'fetch';
    return Promise.reject(blocked(target));
  });
  define('XMLHttpRequest', class XMLHttpRequest {
    open(method, url) { this.url = String(url); }
    send() { throw blocked(this.url || 'XMLHttpRequest'); }
  });
  define('WebSocket', class WebSocket { constructor(url) { throw blocked(url); } });
  define('require', function require(name) { throw new Error(host.require(String(name))); });
  define('setTimeout', function setTimeout(fn, ms, ...args) { return host.schedule(() => fn(...args), ms, false); });
  define('setInterval', function setInterval(fn, ms, ...args) { return host.schedule(() => fn(...args), ms, true); });
  define('clearTimeout', function clearTimeout(id) { host.cancel(id); });
  define('clearInterval', function clearInterval(id) { host.cancel(id); });
  define('queueMicrotask', function queueMicrotask(fn) { Promise.resolve().then(fn); });
  class Element {
    constructor(tagName) { this.tagName = String(tagName).toUpperCase(); this.children = []; this.attributes = {}; this.textContent = ''; }
    appendChild(child) { host.dom(); this.children.push(child); return child; }
    removeChild(child) { host.dom(); this.children = this.children.filter((c) => c !== child); return child; }
    setAttribute(name, value) { host.dom(); this.attributes[name] = String(value); }
    getAttribute(name) { return name in this.attributes ? this.attributes[name] : null; }
  }
  const body = new Element('body');
  define('document', Object.freeze({
    body,
    createElement: (tagName) => new Element(tagName),
    getElementById: () => null,
    querySelector: () => null,
  }));
  return Object.freeze({ snapshot, explain });
})`;

const context = vm.createContext({}, { name: 'sandbox', codeGeneration: { strings: false, wasm: false } });
const internals = vm.runInContext(BOOTSTRAP, context)(host);
const baseline = new Set(vm.runInContext('Object.getOwnPropertyNames(globalThis)', context));

function collect() {
  const values = {};
  const names = new Set([...(payload.bindings || []), ...Object.keys(context)]);
  for (const name of names) {
    if (!IDENTIFIER.test(name) || name.startsWith('_') || hidden.some((prefix) => name.startsWith(prefix))) {
      continue;
    }
    if (baseline.has(name) && !(payload.bindings || []).includes(name)) {
      continue;
    }
    let text;
    try {
      text = internals.snapshot(vm.runInContext(`typeof ${name} === 'undefined' ? undefined : ${name}`, context));
    } catch (error) {
      continue;
    }
    if (typeof text === 'string') {
      values[name] = JSON.parse(text);
    }
  }
  return values;
}

// Host-realm errors come from vm itself or from a stack overflow inside a host
// frame; anything else was thrown by the guest and is described in the context.
function classify(error) {
  if (error instanceof Error) {
    if (error.code === 'ERR_SCRIPT_EXECUTION_TIMEOUT') {
      return { kind: 'ResourceExceeded', message: 'Wall-clock time limit exceeded' };
    }
    if (error.name === 'RangeError' && /call stack/i.test(error.message)) {
      return { kind: 'ResourceExceeded', message: 'Maximum recursion depth exceeded' };
    }
    return { kind: 'RuntimeFault', message: `${error.name}: ${error.message}` };
  }
  try {
    const text = internals.explain(error);
    const fault = typeof text === 'string' ? JSON.parse(text) : null;
    if (fault && (fault.kind === 'RuntimeFault' || fault.kind === 'ResourceExceeded')
        && typeof fault.message === 'string') {
      return { kind: fault.kind, message: fault.message };
    }
  } catch (failure) {
    // fall through
  }
  return { kind: 'RuntimeFault', message: 'Uncaught exception' };
}

let finished = false;

function finish(fault) {
  if (finished) {
    return;
  }
  finished = true;
  if (fault) {
    send('fault', fault);
    process.exit(1);
  }
  if (payload.inspectVariables !== false) {
    send('variables', { values: collect() });
  }
  process.exit(0);
}

process.on('uncaughtException', (error) => finish(classify(error)));
process.on('unhandledRejection', (reason) => finish(classify(reason)));
process.on('beforeExit', () => finish(null));

let script;
try {
  script = new vm.Script(payload.code, { filename: GUEST_FILE });
} catch (error) {
  finish(classify(error));
}
if (script) {
  send('ready');
  try {
    const timeout = Number(payload.maxWallClockMs) > 0 ? Number(payload.maxWallClockMs) : undefined;
    script.runInContext(context, { timeout, breakOnSigint: false });
  } catch (error) {
    finish(classify(error));
  }
}
)JS";

}  // namespace

std::string_view javascript_prelude() noexcept
{
    return kJavaScriptPrelude;
}

}  // namespace secbox::engine
