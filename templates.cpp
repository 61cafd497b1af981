/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <templates.hpp>

const char epub2_chapter_template[] = R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE html PUBLIC "-//W3C//DTD XHTML 1.1//EN" "http://www.w3.org/TR/xhtml11/DTD/xhtml11.dtd">
<html xmlns="http://www.w3.org/1999/xhtml" xml:lang="{{lang}}">
  <head>
    <meta http-equiv="Content-Type" content="application/xhtml+xml; charset=utf-8" />
    <title>{{title}}</title>
    <link rel="stylesheet" type="text/css" href="stylesheet.css" />
  </head>
  <body>
{{{content}}}
  </body>
</html>
)";

const char epub3_chapter_template[] = R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE html>
<html xmlns="http://www.w3.org/1999/xhtml" xmlns:epub="http://www.idpf.org/2007/ops" xml:lang="{{lang}}" lang="{{lang}}">
  <head>
    <meta charset="utf-8" />
    <title>{{title}}</title>
    <link rel="stylesheet" type="text/css" href="stylesheet.css" />
  </head>
  <body>
{{{content}}}
  </body>
</html>
)";

const char epub_stylesheet[] = R"(body {
  margin: 0 5%;
  text-align: justify;
}

h1, h2, h3, h4, h5, h6 {
  text-align: center;
  font-weight: bold;
  page-break-after: avoid;
}

h1 {
  margin-top: 3em;
  margin-bottom: 2em;
}

p {
  margin: 0;
  text-indent: 1em;
}

blockquote p {
  text-indent: 0;
}

pre {
  white-space: pre-wrap;
  font-family: monospace;
}

hr {
  margin: 1em 30%;
}

img {
  max-width: 100%;
}

.notes {
  margin-top: 2em;
  font-size: 0.9em;
}

.cover {
  text-align: center;
}
)";

const char html_page_template[] = R"(<!DOCTYPE html>
<html lang="{{lang}}">
  <head>
    <meta charset="utf-8" />
    <meta name="author" content="{{author}}" />
    <meta name="description" content="{{description}}" />
    <meta name="keywords" content="{{subject}}" />
    <title>{{title}}</title>
    <style type="text/css">
{{{style}}}
    </style>
  </head>
  <body>
    <h1 class="title">{{title}}</h1>
    <h2 class="author">{{author}}</h2>
    <nav id="toc">
{{{toc}}}
    </nav>
{{{content}}}
  </body>
</html>
)";

const char html_stylesheet[] = R"(body {
  max-width: 40em;
  margin: 0 auto;
  padding: 1em;
  line-height: 1.5;
  text-align: justify;
}

h1.title, h2.author {
  text-align: center;
}

.chapter {
  margin-top: 4em;
}

.chapter h1 {
  text-align: center;
}

pre {
  background-color: #f4f4f4;
  padding: 0.5em;
  overflow: auto;
}

blockquote {
  font-style: italic;
}

img {
  max-width: 100%;
}

.notes {
  margin-top: 2em;
  border-top: 1px solid #888;
  font-size: 0.9em;
}
)";
