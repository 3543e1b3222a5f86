#include <limen/task/Task.hpp>
#include <limen/task/Identity.hpp>
#include <limen/runtime/Runtime.hpp>
#include <limen/util/Trace.hpp>

using enum std::memory_order;

namespace limen {

const RawWakerVtable TaskBase::s_wakerVtable = {
    .wake = [](void* data) {
        auto task = static_cast<TaskBase*>(data);
        task->wakeByRef();
        task->decref();
    },
    .wakeByRef = [](void* data) {
        static_cast<TaskBase*>(data)->wakeByRef();
    },
    .clone = [](void* data) -> RawWaker {
        static_cast<TaskBase*>(data)->incref();
        return RawWaker{data, &TaskBase::s_wakerVtable};
    },
    .destroy = [](void* data) {
        static_cast<TaskBase*>(data)->decref();
    },
};

TaskBase::TaskBase(Runtime* runtime, const TaskVtable* vtable) noexcept
    : m_runtime(runtime), m_vtable(vtable), m_id(nextTaskId()) {}

bool TaskBase::exchangeState(uint32_t& expected, uint32_t desired) noexcept {
    return m_state.compare_exchange_weak(expected, desired, acq_rel, acquire);
}

void TaskBase::incref() noexcept {
    m_refs.fetch_add(1, relaxed);
}

void TaskBase::decref() noexcept {
    if (m_refs.fetch_sub(1, acq_rel) == 1) {
        trace("[Task {}] destroying", m_id);
        m_vtable->destroy(this);
    }
}

Waker TaskBase::makeWaker() noexcept {
    this->incref();
    return Waker{this, &s_wakerVtable};
}

void TaskBase::wakeByRef() noexcept {
    auto state = m_state.load(acquire);

    while (true) {
        if (state & (TASK_COMPLETED | TASK_CLOSED | TASK_SCHEDULED)) {
            return;
        }

        if (this->exchangeState(state, state | TASK_SCHEDULED)) {
            break;
        }
    }

    // a running task is requeued by the worker polling it
    if ((state & TASK_RUNNING) == 0) {
        this->incref();
        m_runtime->enqueueTask(this);
    }
}

void TaskBase::run() {
    auto state = m_state.load(acquire);

    while (true) {
        if (state & TASK_CLOSED) {
            trace("[Task {}] closed, dropping future", m_id);
            this->dropFuture();
            this->complete();
            this->decref();
            return;
        }

        if (this->exchangeState(state, (state & ~TASK_SCHEDULED) | TASK_RUNNING)) {
            break;
        }
    }

    bool ready;
    {
        auto& cx = ctx();
        auto waker = this->makeWaker();

        auto prevWaker = std::exchange(cx.m_waker, &waker);
        auto prevTask = std::exchange(cx.m_task, this);
        auto prevRuntime = std::exchange(cx.m_runtime, m_runtime);

        try {
            ready = m_vtable->poll(this);
        } catch (...) {
            m_exception = std::current_exception();
            ready = true;
        }

        cx.m_waker = prevWaker;
        cx.m_task = prevTask;
        cx.m_runtime = prevRuntime;
    }

    if (ready) {
        this->dropFuture();
        this->complete();
        this->decref();
        return;
    }

    state = m_state.load(acquire);

    while (true) {
        if (state & TASK_CLOSED) {
            this->dropFuture();
            this->complete();
            this->decref();
            return;
        }

        if (this->exchangeState(state, state & ~TASK_RUNNING)) {
            break;
        }
    }

    if (state & TASK_SCHEDULED) {
        // woken while running, the reference held by the worker moves back into the queue
        m_runtime->enqueueTask(this);
    } else {
        this->decref();
    }
}

void TaskBase::dropFuture() noexcept {
    if (m_futureDropped) return;

    m_futureDropped = true;
    m_vtable->dropFuture(this);
}

void TaskBase::complete() noexcept {
    std::optional<Waker> waker;
    {
        auto awaiter = m_awaiter.lock();

        auto state = m_state.load(acquire);
        while (!this->exchangeState(state, (state | TASK_COMPLETED) & ~(TASK_RUNNING | TASK_SCHEDULED))) {}

        waker = std::move(awaiter->waker);
        awaiter->waker.reset();

        // the awaiter may be a condvar waker on another thread's stack, it must be woken before unlocking
        if (waker) {
            waker->wake();
        }
    }
}

bool TaskBase::pollCompletion(const Waker& waker) {
    auto awaiter = m_awaiter.lock();

    if (m_state.load(acquire) & TASK_COMPLETED) {
        return true;
    }

    if (!awaiter->waker || !awaiter->waker->equals(waker)) {
        awaiter->waker = waker.clone();
    }

    return false;
}

void TaskBase::abort() noexcept {
    auto state = m_state.load(acquire);

    while (true) {
        if (state & (TASK_COMPLETED | TASK_CLOSED)) {
            return;
        }

        auto newState = state | TASK_CLOSED;
        if ((state & (TASK_SCHEDULED | TASK_RUNNING)) == 0) {
            newState |= TASK_SCHEDULED;
        }

        if (this->exchangeState(state, newState)) {
            break;
        }
    }

    trace("[Task {}] aborted", m_id);

    // schedule it so the future gets dropped by the runtime
    if ((state & (TASK_SCHEDULED | TASK_RUNNING)) == 0) {
        this->incref();
        m_runtime->enqueueTask(this);
    }
}

}
