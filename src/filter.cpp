// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#include "callscope/filter.hpp"
#include "callscope/errors.hpp"

namespace callscope {

const char *verdict_to_string(Verdict verdict) {
    switch (verdict) {
    case Verdict::Include:
        return "include";
    case Verdict::Extern:
        return "extern";
    case Verdict::Ignored:
        return "ignored";
    case Verdict::IgnoredByPattern:
        return "ignored-by-pattern";
    case Verdict::Trimmed:
        return "trimmed";
    default:
        return "unknown";
    }
}

const std::unordered_set<std::string> &trim_set() {
    // Locking, scheduling, barrier, refcount, bit and allocation helpers that
    // dominate kernel call graphs without telling the reader anything
    static const std::unordered_set<std::string> symbols = {
        // spinlocks
        "spin_lock", "spin_unlock", "spin_lock_irq", "spin_unlock_irq", "spin_lock_irqsave",
        "spin_unlock_irqrestore", "spin_lock_bh", "spin_unlock_bh", "spin_trylock",
        "_raw_spin_lock", "_raw_spin_unlock", "_raw_spin_lock_irq", "_raw_spin_unlock_irq",
        "_raw_spin_lock_irqsave", "_raw_spin_unlock_irqrestore", "_raw_spin_lock_bh",
        "_raw_spin_unlock_bh", "_raw_spin_trylock", "raw_spin_lock", "raw_spin_unlock",
        "raw_spin_lock_irqsave", "raw_spin_unlock_irqrestore", "__raw_spin_lock",
        "__raw_spin_unlock",
        // rwlocks
        "read_lock", "read_unlock", "write_lock", "write_unlock", "read_lock_irqsave",
        "read_unlock_irqrestore", "write_lock_irqsave", "write_unlock_irqrestore",
        "read_lock_bh", "read_unlock_bh", "write_lock_bh", "write_unlock_bh",
        "write_lock_irq", "write_unlock_irq", "_raw_read_lock", "_raw_read_unlock",
        "_raw_write_lock", "_raw_write_unlock",
        // sleeping locks
        "mutex_lock", "mutex_unlock", "mutex_trylock", "mutex_lock_interruptible",
        "mutex_lock_killable", "down", "up", "down_read", "up_read", "down_write", "up_write",
        "down_interruptible", "down_trylock", "down_read_trylock", "down_write_trylock",
        "downgrade_write",
        // rcu
        "rcu_read_lock", "rcu_read_unlock", "rcu_read_lock_bh", "rcu_read_unlock_bh",
        "rcu_read_lock_sched", "rcu_read_unlock_sched", "synchronize_rcu", "call_rcu",
        // preemption and interrupts
        "preempt_disable", "preempt_enable", "preempt_enable_no_resched", "preempt_count",
        "local_irq_save", "local_irq_restore", "local_irq_disable", "local_irq_enable",
        "local_bh_disable", "local_bh_enable", "irqs_disabled",
        // scheduling
        "schedule", "cond_resched", "might_sleep", "__might_sleep", "yield", "need_resched",
        "wake_up", "wake_up_process", "__wake_up", "wake_up_interruptible",
        "wake_up_all", "might_resched", "smp_processor_id", "get_cpu", "put_cpu",
        // barriers
        "barrier", "mb", "rmb", "wmb", "smp_mb", "smp_rmb", "smp_wmb",
        "smp_mb__before_atomic", "smp_mb__after_atomic", "read_barrier_depends",
        "smp_read_barrier_depends", "cpu_relax",
        // atomics and refcounts
        "atomic_inc", "atomic_dec", "atomic_add", "atomic_sub", "atomic_read",
        "atomic_set", "atomic_inc_return", "atomic_dec_return", "atomic_dec_and_test",
        "atomic_inc_and_test", "atomic_cmpxchg", "atomic_xchg", "atomic_dec_and_lock",
        "refcount_inc", "refcount_dec", "refcount_dec_and_test", "refcount_read",
        "kref_get", "kref_put", "get_page", "put_page",
        // bit twiddling
        "set_bit", "clear_bit", "change_bit", "test_bit", "test_and_set_bit",
        "test_and_clear_bit", "test_and_change_bit", "__set_bit", "__clear_bit",
        "__test_and_set_bit", "__test_and_clear_bit", "find_first_bit", "find_next_bit",
        "find_first_zero_bit", "find_next_zero_bit", "ffs", "fls", "ffz", "__ffs", "__fls",
        "hweight32", "hweight64", "bitmap_zero", "bitmap_fill",
        // string and memory helpers
        "memcpy", "memset", "memmove", "memcmp", "strcpy", "strncpy", "strlen", "strcmp",
        "strncmp", "strlcpy", "strscpy", "__memcpy", "__memset",
        // user copies
        "copy_to_user", "copy_from_user", "__copy_to_user", "__copy_from_user",
        "get_user", "put_user", "__get_user", "__put_user",
        // allocation
        "kmalloc", "kzalloc", "kfree", "kcalloc", "krealloc", "vmalloc", "vfree",
        "kmem_cache_alloc", "kmem_cache_free", "kmem_cache_zalloc",
        // diagnostics
        "printk", "_printk", "panic", "BUG", "WARN_ON", "BUG_ON", "dump_stack",
        "warn_slowpath_fmt", "__warn_printk",
    };
    return symbols;
}

std::vector<std::regex> FilterRegistry::compile(const std::vector<std::string> &patterns,
                                                const char *label) {
    std::vector<std::regex> compiled;
    compiled.reserve(patterns.size());
    for (const auto &pattern : patterns) {
        try {
            compiled.emplace_back(pattern, std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::regex_error &e) {
            throw ConfigError(std::string("Invalid ") + label + " pattern '" + pattern +
                              "': " + e.what());
        }
    }
    return compiled;
}

FilterRegistry::FilterRegistry(const FilterConfig &config)
    : ignore_(config.ignore.begin(), config.ignore.end()),
      ignore_patterns_(compile(config.ignore_patterns, "ignore")),
      show_(config.show.begin(), config.show.end()),
      show_patterns_(compile(config.show_patterns, "show")), trim_(config.trim),
      no_extern_(config.no_extern) {}

Verdict FilterRegistry::classify(const Graph &graph, NodeId id) {
    const std::string &name = graph.get_symbol(id);

    if (no_extern_ && (dynamic_ignore_.count(name) || !graph.is_defined(id))) {
        dynamic_ignore_.insert(name);
        return Verdict::Extern;
    }
    if (ignore_.count(name)) {
        return Verdict::Ignored;
    }
    for (const auto &pattern : ignore_patterns_) {
        if (std::regex_search(name, pattern)) {
            return Verdict::IgnoredByPattern;
        }
    }
    if (trim_ && trim_set().count(name)) {
        return Verdict::Trimmed;
    }
    return Verdict::Include;
}

bool FilterRegistry::is_shown(const std::string &name) const {
    if (show_.count(name)) {
        return true;
    }
    for (const auto &pattern : show_patterns_) {
        if (std::regex_search(name, pattern)) {
            return true;
        }
    }
    return false;
}

} // namespace callscope
