#include "doc_content.h"

namespace ldmcp::docs::content {

const std::string_view kGettingStarted = R"md(## Creating a project

Install the tooling once:

```bash
cargo install cargo-leptos --locked
cargo install trunk --locked   # client-side rendering only
rustup target add wasm32-unknown-unknown
```

Start a full-stack (SSR + hydration) project from the Axum template:

```bash
cargo leptos new --git https://github.com/leptos-rs/start-axum
cd my-app
cargo leptos watch
```

For a client-side-rendered app, add the crate with the `csr` feature and serve
with Trunk:

```toml
[dependencies]
leptos = { version = "0.8", features = ["csr"] }
```

## Hello world

```rust
use leptos::prelude::*;

#[component]
fn App() -> impl IntoView {
    let (count, set_count) = signal(0);

    view! {
        <button on:click=move |_| *set_count.write() += 1>
            "Clicked " {count} " times"
        </button>
    }
}

fn main() {
    leptos::mount::mount_to_body(App);
}
```

## Key points

- Import everything from `leptos::prelude::*`.
- Components are plain functions annotated with `#[component]` that return `impl IntoView`.
- Components run once; only the reactive closures inside `view!` re-run.
)md";

const std::string_view kComponents = R"md(## Defining components

A component is a function marked `#[component]` that returns `impl IntoView`.
Its arguments become props.

```rust
#[component]
fn ProgressBar(
    /// Maximum value of the bar
    #[prop(default = 100)]
    max: u16,
    /// Current progress, read reactively
    #[prop(into)]
    progress: Signal<i32>,
) -> impl IntoView {
    view! { <progress max=max value=progress /> }
}
```

Use it like an element:

```rust
view! { <ProgressBar progress=count /> }
```

## Prop attributes

- `#[prop(optional)]`: the prop may be omitted; its type's `Default` is used.
- `#[prop(default = expr)]`: explicit default value.
- `#[prop(into)]`: accept anything that implements `Into<T>` (useful for `Signal<T>`).
- `#[prop(optional, into)]` can be combined.

## Children

```rust
#[component]
fn Card(children: Children) -> impl IntoView {
    view! { <div class="card">{children()}</div> }
}

view! { <Card><p>"Inside the card"</p></Card> }
```

Use `ChildrenFn` when the children must be rendered more than once.

## Rules

- Always annotate with `#[component]`; without it props are not generated.
- Component names are `UpperCamelCase`.
- The function body runs once. Put reactive reads inside closures.
)md";

const std::string_view kSignals = R"md(## Creating signals

```rust
let (count, set_count) = signal(0);      // split read/write halves
let value = RwSignal::new(String::new()); // single read-write handle
```

`signal()` replaces `create_signal()` from Leptos 0.6 and earlier.

## Reading

- `count.get()` clones the value and tracks the signal.
- `count.with(|v| ...)` borrows the value and tracks the signal.
- `count.read()` returns a read guard.
- `count.get_untracked()` reads without subscribing.

## Writing

- `set_count.set(5)` replaces the value.
- `set_count.update(|n| *n += 1)` mutates in place.
- `*set_count.write() += 1` mutates through a write guard.

## Derived values

```rust
let double = move || count.get() * 2;         // cheap derived signal
let expensive = Memo::new(move |_| heavy(count.get())); // cached
```

Prefer plain closures; reach for `Memo` only when the computation is costly or
many readers depend on it.

## Effects

```rust
Effect::new(move |_| {
    log::info!("count is {}", count.get());
});
```

Effects are for synchronising with the outside world (logging, DOM APIs,
storage). Do not use them to copy one signal into another; derive instead.

## In views

Wrap reads in a closure so the view updates:

```rust
view! { <p>{move || count.get()}</p> }
```

Passing the signal itself (`{count}`) is also reactive.
)md";

const std::string_view kViews = R"md(## The view! macro

`view!` uses an HTML-like (RSX) syntax. Text must be quoted.

```rust
view! {
    <div class="container">
        <h1>"Title"</h1>
        <p>{move || message.get()}</p>
    </div>
}
```

## Dynamic attributes

```rust
view! {
    <div
        class:active=move || is_active.get()
        class=("text-red", move || has_error.get())
        style:width=move || format!("{}px", width.get())
        id=move || format!("item-{}", id.get())
    />
}
```

## Events

```rust
view! {
    <button on:click=move |_| set_open.set(true)>"Open"</button>
    <input on:input=move |ev| set_name.set(event_target_value(&ev)) />
}
```

## Control flow

```rust
view! {
    <Show when=move || logged_in.get() fallback=|| view! { <Login /> }>
        <Dashboard />
    </Show>

    <For
        each=move || todos.get()
        key=|todo| todo.id
        children=move |todo| view! { <li>{todo.title}</li> }
    />
}
```

`if` / `match` inside a closure also work; return the same type from each branch
or call `.into_any()`.

## Properties vs attributes

Use `prop:value` to set a DOM property (for example the current value of an
input) instead of the initial HTML attribute.
)md";

const std::string_view kResources = R"md(## Loading async data

A `Resource` runs an async loader whenever its tracked inputs change and is
serialised from the server to the client during hydration.

```rust
let (user_id, set_user_id) = signal(1);

let user = Resource::new(
    move || user_id.get(),
    |id| async move { fetch_user(id).await },
);
```

Read it inside `Suspense` or `Transition`:

```rust
view! {
    <Suspense fallback=|| view! { <p>"Loading..."</p> }>
        {move || user.get().map(|u| view! { <p>{u.name}</p> })}
    </Suspense>
}
```

Inside `Suspend::new(async move { ... })` you can `.await` the resource directly.

## Variants

- `Resource`: SSR-friendly, the value must be serialisable.
- `LocalResource`: runs only in the browser; no serialisation required.
- `OnceResource`: loads once and never re-runs.

## Tips

- Keep the source closure cheap; it decides when the loader re-runs.
- Do not create resources inside reactive closures; create them in the component body.
)md";

const std::string_view kActions = R"md(## Actions

Actions run async work in response to user events (mutations), unlike
resources which load data.

```rust
let add_todo = Action::new(|title: &String| {
    let title = title.clone();
    async move { create_todo(title).await }
});

view! {
    <button on:click=move |_| { add_todo.dispatch("Buy milk".to_string()); }>
        "Add"
    </button>
    <p>{move || add_todo.pending().get().then_some("Saving...")}</p>
}
```

Useful signals: `pending()`, `value()`, `input()`, `version()`.

## Server actions and forms

```rust
#[server]
pub async fn add_todo(title: String) -> Result<(), ServerFnError> {
    // database insert
    Ok(())
}

#[component]
fn AddTodo() -> impl IntoView {
    let add = ServerAction::<AddTodo>::new();
    view! {
        <ActionForm action=add>
            <input type="text" name="title" />
            <input type="submit" value="Add" />
        </ActionForm>
    }
}
```

`ActionForm` works without JavaScript and progressively enhances once hydrated.
Input `name` attributes must match the server function's argument names.

## Refetching after a mutation

Track `action.version()` in a resource's source so it reloads after each submit.
)md";

const std::string_view kServerFunctions = R"md(## Declaring a server function

```rust
#[server]
pub async fn get_posts(limit: usize) -> Result<Vec<Post>, ServerFnError> {
    let pool = expect_context::<PgPool>();
    let posts = sqlx::query_as("SELECT * FROM posts LIMIT $1")
        .bind(limit as i64)
        .fetch_all(&pool)
        .await?;
    Ok(posts)
}
```

The body is compiled only for the server; the client gets a stub that issues an
HTTP request. Arguments and return values must be serialisable.

## Rules

- Always return `Result<T, ServerFnError>` (or a custom error type implementing `FromServerFnError`).
- Server-only imports belong inside the function body or behind `#[cfg(feature = "ssr")]`.
- Register the function's crate features: `ssr` on the server, `hydrate` on the client.

## Extractors (Axum)

```rust
#[server]
pub async fn whoami() -> Result<String, ServerFnError> {
    use axum::http::HeaderMap;
    let headers: HeaderMap = leptos_axum::extract().await?;
    Ok(format!("{:?}", headers.get("user-agent")))
}
```

## Context

Provide shared state (database pools, config) with
`leptos_routes_with_context` and read it with `expect_context::<T>()`.
)md";

const std::string_view kRouting = R"md(## Setup

```toml
leptos_router = "0.8"
```

```rust
use leptos_router::{components::*, path};

#[component]
fn App() -> impl IntoView {
    view! {
        <Router>
            <nav><A href="/">"Home"</A> <A href="/users">"Users"</A></nav>
            <main>
                <Routes fallback=|| "Not found.">
                    <Route path=path!("/") view=Home />
                    <ParentRoute path=path!("/users") view=Users>
                        <Route path=path!("") view=|| "Select a user" />
                        <Route path=path!(":id") view=UserProfile />
                    </ParentRoute>
                </Routes>
            </main>
        </Router>
    }
}
```

Nested routes render inside the parent's `<Outlet />`.

## Params and queries

```rust
use leptos_router::hooks::{use_params_map, use_query_map};

let params = use_params_map();
let id = move || params.read().get("id").unwrap_or_default();
```

Typed params: derive `Params` and call `use_params::<MyParams>()`.

## Navigation

- `<A href="...">` for links (handles client-side navigation and active state).
- `use_navigate()` for programmatic navigation.
- `<Redirect path="/login" />` to redirect during rendering.
)md";

const std::string_view kForms = R"md(## Controlled inputs

```rust
let (name, set_name) = signal(String::new());

view! {
    <input
        type="text"
        prop:value=name
        on:input:target=move |ev| set_name.set(ev.target().value())
    />
    <p>"Name: " {name}</p>
}
```

Use `prop:value`, not `value=`. The `value` attribute only sets the initial
value; after the user types, the DOM property and the attribute diverge.

## Two-way binding

```rust
view! { <input type="text" bind:value=(name, set_name) /> }
```

`bind:checked` works for checkboxes.

## Uncontrolled inputs

```rust
let input_ref: NodeRef<html::Input> = NodeRef::new();

let on_submit = move |ev: SubmitEvent| {
    ev.prevent_default();
    let value = input_ref.get().expect("input exists").value();
    set_name.set(value);
};

view! {
    <form on:submit=on_submit>
        <input type="text" node_ref=input_ref />
        <input type="submit" value="Submit" />
    </form>
}
```

## Validation

Derive error messages from the input signal:

```rust
let error = move || name.with(|n| n.is_empty().then_some("Name is required"));
```

For server-backed forms see `ActionForm` in the Actions section.
)md";

const std::string_view kErrorHandling = R"md(## Results in views

A `Result<T, E>` renders its `Ok` value; an `Err` is propagated to the nearest
`ErrorBoundary`.

```rust
let (value, set_value) = signal(Ok(0));

view! {
    <input on:input:target=move |ev| set_value.set(ev.target().value().parse::<i32>()) />
    <ErrorBoundary fallback=|errors| view! {
        <ul>
            {move || errors.get().into_iter()
                .map(|(_, e)| view! { <li>{e.to_string()}</li> })
                .collect_view()}
        </ul>
    }>
        <p>"Value: " {value}</p>
    </ErrorBoundary>
}
```

The boundary clears automatically once the value becomes `Ok` again.

## Server function errors

Server functions return `Result<T, ServerFnError>`. Use `?` to convert errors:

```rust
#[server]
pub async fn load(id: u32) -> Result<Item, ServerFnError> {
    let item = db::find(id).await.map_err(|e| ServerFnError::new(e.to_string()))?;
    Ok(item)
}
```

## Guidelines

- Avoid `unwrap()` in components; a panic in WASM kills the whole app.
- Combine `Suspense` (loading) with `ErrorBoundary` (failure) around async data.
)md";

const std::string_view kSuspense = R"md(## Suspense

`Suspense` shows a fallback while any resource read inside it is loading.

```rust
view! {
    <Suspense fallback=move || view! { <p>"Loading..."</p> }>
        {move || Suspend::new(async move {
            let posts = posts.await;
            view! { <PostList posts /> }
        })}
    </Suspense>
}
```

## Transition

`Transition` shows the fallback only on the first load; afterwards it keeps the
previous content visible while new data loads, avoiding flicker.

```rust
view! {
    <Transition fallback=|| "Loading...">
        {move || data.get().map(|d| view! { <Table rows=d /> })}
    </Transition>
}
```

## Streaming SSR

With `SsrMode::OutOfOrder` (the default) the server sends the shell
immediately and streams each `Suspense` fragment as it resolves. Use
`SsrMode::Async` on a route when its content must be complete before the
response starts, for example for `<Title>` and meta tags.

## Tips

- Read resources inside the `Suspense` children, not in the component body.
- Wrap async trees in both `Suspense` and `ErrorBoundary`.
)md";

}  // namespace ldmcp::docs::content
